#include "interpreter.h"
#include "text-input-stream.h"
#include "file-output-stream.h"
#include "glog/logging.h"
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <memory>
#include <string>

namespace {

void PrintUsage(const char *prog) {
    fprintf(stderr, "usage: %s [-i] [--structural] [--max-structs N] "
            "[--max-depth N] [file]\n", prog);
}

bool ParseInt(const char *z, int *value) {
    char *end = nullptr;
    auto n = strtol(z, &end, 10);
    if (end == z || *end != '\0' || n <= 0 || n > INT32_MAX) {
        return false;
    }
    *value = static_cast<int>(n);
    return true;
}

} // namespace

int main(int argc, char *argv[]) {
    google::InitGoogleLogging(argv[0]);

    rlisp::Interpreter::Options options;
    bool interactive = false;
    std::string file_name;
    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "-i") == 0) {
            interactive = true;
        } else if (strcmp(argv[i], "--structural") == 0) {
            options.signature_policy = rlisp::SIGNATURE_STRUCTURAL;
        } else if (strcmp(argv[i], "--max-structs") == 0 && i + 1 < argc) {
            if (!ParseInt(argv[++i], &options.max_struct_types)) {
                PrintUsage(argv[0]);
                return 1;
            }
        } else if (strcmp(argv[i], "--max-depth") == 0 && i + 1 < argc) {
            if (!ParseInt(argv[++i], &options.max_eval_depth)) {
                PrintUsage(argv[0]);
                return 1;
            }
        } else if (argv[i][0] != '-' && file_name.empty()) {
            file_name = argv[i];
        } else {
            PrintUsage(argv[0]);
            return 1;
        }
    }
    // Without a file the session is a REPL on stdin.
    interactive = interactive || file_name.empty();
    options.interactive = false;

    std::unique_ptr<rlisp::TextStreamFactory>
            text_streams(rlisp::CreateFileStreamFactory());
    std::unique_ptr<rlisp::TextOutputStream>
            output(rlisp::CreateStdoutOutputStream());
    std::unique_ptr<rlisp::TextInputStream>
            input(rlisp::CreateStdinInputStream());

    rlisp::Interpreter interpreter(options, text_streams.get(),
                                   output.get());
    if (!interpreter.Init()) {
        LOG(ERROR) << "interpreter initialize fail!";
        return 1;
    }
    interpreter.evaluator()->set_input(input.get());

    auto ok = true;
    if (!file_name.empty()) {
        ok = interpreter.Execute(file_name);
    }
    if (interactive && !interpreter.should_exit()) {
        interpreter.Repl(input.get());
    }
    if (interpreter.should_exit()) {
        return interpreter.exit_code();
    }
    return ok ? 0 : 1;
}
