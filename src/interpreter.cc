#include "interpreter.h"
#include "builtins.h"
#include "environment.h"
#include "frame-collector.h"
#include "value-factory.h"
#include "struct-registry.h"
#include "parser.h"
#include "error-codes.h"
#include "fixed-memory-input-stream.h"
#include "text-input-stream.h"
#include "text-output-stream.h"
#include "glog/logging.h"
#include <vector>

namespace rlisp {

namespace {

// The form may be completed by following lines. A stray closer is also
// 005, but the parser has not reached the end then.
bool IsIncompleteInput(const Parser &parser, int code) {
    switch (code) {
        case ERR_UNCLOSED_LIST:
        case ERR_UNCLOSED_INFIX_LIST:
            return parser.AtEnd();
        case ERR_UNCLOSED_STRING:
        case ERR_UNCLOSED_INTERPOLATION:
            return true;
        default:
            break;
    }
    return false;
}

const char kContinuationPrompt[] = "... ";

} // namespace

Interpreter::Interpreter(const Options &options,
                         TextStreamFactory *text_streams,
                         TextOutputStream *output)
    : options_(options)
    , values_(new ValueFactory())
    , structs_(new StructRegistry(values_, options.max_struct_types))
    , evaluator_(new Evaluator(values_, structs_, text_streams))
    , collector_(new FrameCollector())
    , global_(new Environment(Handle<Environment>(), collector_))
    , text_streams_(text_streams)
    , output_(DCHECK_NOTNULL(output)) {
    evaluator_->set_output(output_);
    evaluator_->set_max_eval_depth(options_.max_eval_depth);
    evaluator_->set_signature_policy(options_.signature_policy);
}

Interpreter::~Interpreter() {
    global_ = Handle<Environment>();
    delete evaluator_;
    // Global definitions are cycles through the global frame.
    collector_->Collect();
    delete collector_;
    delete structs_;
    delete values_;
}

bool Interpreter::Init() {
    if (initialized_) {
        return true;
    }
    if (options_.max_struct_types <= 0 || options_.max_eval_depth <= 0) {
        LOG(ERROR) << "bad options, max_struct_types: "
                   << options_.max_struct_types << " max_eval_depth: "
                   << options_.max_eval_depth;
        return false;
    }

    BaseLibrary::Install(values_, global_.get());
    global_->Put("_", values_->nil());
    initialized_ = true;
    DLOG(INFO) << "session initialized, " << global_->size() << " bindings";
    return true;
}

Handle<Value> Interpreter::last_value() const {
    auto value = global_->LookupLocal("_");
    return value.empty() ? Handle<Value>(values_->nil()) : value;
}

bool Interpreter::Execute(const std::string &key) {
    DCHECK(initialized_);
    if (!text_streams_) {
        ReportError(values_->NewError(ERR_READ_FILE,
                                      values_->NewString(key + ": no source")));
        return false;
    }

    Parser parser(values_, text_streams_);
    auto input = parser.SwitchInputStream(key);
    if (!input->error().empty()) {
        LOG(ERROR) << "can not open: " << key << ", " << input->error();
        ReportError(values_->NewError(ERR_READ_FILE,
                                      values_->NewString(key + ": " +
                                                         input->error())));
        return false;
    }
    return Run(&parser, options_.interactive);
}

bool Interpreter::ExecuteString(const std::string &source) {
    DCHECK(initialized_);
    Parser parser(values_, text_streams_);
    parser.SwitchInputStream(new FixedMemoryInputStream(source), true);
    return Run(&parser, options_.interactive);
}

void Interpreter::Repl(TextInputStream *input) {
    DCHECK(initialized_);
    evaluator_->set_input(input);

    std::string source;
    std::string line;
    while (!should_exit()) {
        output_->Write(source.empty() ? options_.prompt.c_str()
                                      : kContinuationPrompt);
        FlushOutput();
        if (!input->ReadLine(&line)) {
            if (!input->error().empty()) {
                LOG(ERROR) << input->file_name() << ": " << input->error();
            }
            break;
        }
        source.append(line).append("\n");

        Parser parser(values_, text_streams_);
        parser.SwitchInputStream(new FixedMemoryInputStream(source), true);
        std::vector<Handle<Value>> forms;
        bool ok = true;
        while (ok && !parser.AtEnd()) {
            auto form = parser.ParseForm(&ok);
            if (ok) {
                forms.push_back(form);
            }
        }
        if (!ok) {
            auto error = parser.last_error();
            if (IsIncompleteInput(parser, error.code)) {
                continue;
            }
            ReportError(values_->NewError(error.code,
                                          values_->NewString(error.message)));
            source.clear();
            continue;
        }

        source.clear();
        for (const auto &form : forms) {
            EvalTopLevel(form, true);
            if (should_exit()) {
                break;
            }
        }
    }
    evaluator_->set_input(nullptr);
}

bool Interpreter::Run(Parser *parser, bool echo) {
    auto all_ok = true;
    while (!should_exit() && !parser->AtEnd()) {
        bool ok = true;
        auto form = parser->ParseForm(&ok);
        if (!ok) {
            auto error = parser->last_error();
            ReportError(values_->NewError(error.code,
                                          values_->NewString(error.ToString())));
            return false;
        }
        all_ok = EvalTopLevel(form, echo) && all_ok;
    }
    return all_ok;
}

bool Interpreter::EvalTopLevel(Handle<Value> form, bool echo) {
    auto ok = EvalForm(form, echo);
    collector_->Collect();
    return ok;
}

bool Interpreter::EvalForm(Handle<Value> form, bool echo) {
    evaluator_->ClearError();
    bool ok = true;
    auto result = evaluator_->EvalForm(form, global_, &ok);
    if (!ok) {
        if (evaluator_->has_error()) {
            ReportError(evaluator_->last_error());
            evaluator_->ClearError();
            return false;
        }
        // `exit' was called.
        DCHECK(should_exit());
        return true;
    }

    global_->Put("_", result);
    if (echo && !result->IsNil()) {
        output_->Write(result->ToString());
        output_->Write("\n", 1);
        FlushOutput();
    }
    return true;
}

void Interpreter::ReportError(Handle<ErrorValue> error) {
    BaseLibrary::WriteError(output_, error.get());
    FlushOutput();
}

void Interpreter::FlushOutput() {
    if (!output_->Flush()) {
        LOG(ERROR) << output_->file_name() << ": " << output_->error();
    }
}

} // namespace rlisp
