#ifndef RLISP_MACRO_EXPANDER_H_
#define RLISP_MACRO_EXPANDER_H_

#include "values.h"
#include <unordered_map>
#include <string>

namespace rlisp {

class Evaluator;

/**
 * Rewrites a macro call into the term to evaluate at the call site.
 *
 * Expansion is not hygienic: names introduced by the expansion can capture
 * or be captured by names of the call site.
 */
class MacroExpander {
public:
    typedef std::unordered_map<std::string, Handle<Value>> Bindings;

    explicit MacroExpander(Evaluator *evaluator);

    /**
     * `form' is the whole call `(name arg ...)', arguments are not
     * evaluated.
     */
    Handle<Value> Expand(Handle<Macro> macro, Handle<Value> form, bool *ok);

    /**
     * Bind names of `pattern' to parts of `input'. Literal atoms must be
     * equal, nested lists must have the same length.
     */
    bool Match(const Value *pattern, Handle<Value> input, Bindings *bindings,
               bool *ok);

    /**
     * Copy of `templ' with bound names replaced.
     */
    Handle<Value> Substitute(Handle<Value> templ, const Bindings &bindings);

    DISALLOW_IMPLICIT_CONSTRUCTORS(MacroExpander)
private:
    Handle<Value> ExpandTemplate(Macro *macro, const ValueList &args,
                                 bool *ok);
    Handle<Value> ExpandRule(Macro *macro, const ValueList &args, bool *ok);

    Evaluator *evaluator_;
}; // class MacroExpander

} // namespace rlisp

#endif // RLISP_MACRO_EXPANDER_H_
