#ifndef RLISP_INTERPRETER_H_
#define RLISP_INTERPRETER_H_

#include "values.h"
#include "evaluator.h"
#include <string>

namespace rlisp {

class Environment;
class FrameCollector;
class Parser;
class StructRegistry;
class TextInputStream;
class TextOutputStream;
class TextStreamFactory;
class ValueFactory;

/**
 * One session: the global environment, the struct registry and the `_'
 * binding live here.
 */
class Interpreter {
public:
    struct Options {
        int max_struct_types = kDefaultMaxStructTypes;
        int max_eval_depth = kDefaultMaxEvalDepth;
        SignaturePolicy signature_policy = SIGNATURE_NOMINAL;
        std::string prompt = "rlisp> ";
        // Echo every non-nil result.
        bool interactive = false;
    };

    /**
     * `text_streams' and `output' are not owned.
     */
    Interpreter(const Options &options, TextStreamFactory *text_streams,
                TextOutputStream *output);
    ~Interpreter();

    /**
     * Install builtins, must be first calling.
     */
    bool Init();

    /**
     * Run all forms of `key'. Returns false if any form failed, a failed
     * form does not stop the following ones, a parsing error does.
     */
    bool Execute(const std::string &key);

    bool ExecuteString(const std::string &source);

    /**
     * Read forms from `input' until EOF or `exit'. A form may span lines.
     */
    void Repl(TextInputStream *input);

    DEF_GETTER(Options, options)
    DEF_PTR_GETTER(ValueFactory, values)
    DEF_PTR_GETTER(StructRegistry, structs)
    DEF_PTR_GETTER(Evaluator, evaluator)
    DEF_PTR_GETTER(FrameCollector, collector)
    DEF_GETTER(Handle<Environment>, global)

    bool should_exit() const { return evaluator_->should_exit(); }
    int exit_code() const { return evaluator_->exit_code(); }

    /**
     * Value of the last successful form, `nil' at beginning.
     */
    Handle<Value> last_value() const;

    DISALLOW_IMPLICIT_CONSTRUCTORS(Interpreter)
private:
    bool Run(Parser *parser, bool echo);

    /**
     * Evaluate one form, then release the frames it left unreachable.
     */
    bool EvalTopLevel(Handle<Value> form, bool echo);

    bool EvalForm(Handle<Value> form, bool echo);

    void ReportError(Handle<ErrorValue> error);

    void FlushOutput();

    Options options_;
    ValueFactory *values_;
    StructRegistry *structs_;
    Evaluator *evaluator_;
    FrameCollector *collector_;
    Handle<Environment> global_;
    TextStreamFactory *text_streams_;
    TextOutputStream *output_;
    bool initialized_ = false;
}; // class Interpreter

} // namespace rlisp

#endif // RLISP_INTERPRETER_H_
