#include "macro-expander.h"
#include "evaluator.h"
#include "environment.h"
#include "value-factory.h"
#include "error-codes.h"
#include "glog/logging.h"

namespace rlisp {

#define CHECK_OK ok); if (!*ok) { return 0; } ((void)0

namespace {

void ListElements(const Value *list, ValueList *elements) {
    if (list->IsPair()) {
        list->AsPair()->ToVector(elements);
    }
}

} // namespace

MacroExpander::MacroExpander(Evaluator *evaluator)
    : evaluator_(DCHECK_NOTNULL(evaluator)) {
}

Handle<Value> MacroExpander::Expand(Handle<Macro> macro, Handle<Value> form,
                                    bool *ok) {
    ValueList elements;
    if (!form->IsPair() || !form->AsPair()->ToVector(&elements)) {
        evaluator_->ThrowError(ERR_PARSE_EXPRESSION, "macro call: %s",
                               form->ToString().c_str());
        *ok = false;
        return nullptr;
    }
    ValueList args(elements.begin() + 1, elements.end());

    ValueList params;
    ListElements(macro->pattern().get(), &params);
    if (params.size() != args.size()) {
        evaluator_->ThrowError(ERR_ARITY_MISMATCH, "`%s' expected %d, found %d",
                               macro->name().c_str(),
                               static_cast<int>(params.size()),
                               static_cast<int>(args.size()));
        *ok = false;
        return nullptr;
    }

    Handle<Value> expansion;
    switch (macro->transformer()) {
        case Macro::TEMPLATE:
            expansion = ExpandTemplate(macro.get(), args, CHECK_OK);
            break;
        case Macro::RULE:
            expansion = ExpandRule(macro.get(), args, CHECK_OK);
            break;
    }
    VLOG(1) << "expand: " << form->ToString() << " => "
            << expansion->ToString();
    return expansion;
}

bool MacroExpander::Match(const Value *pattern, Handle<Value> input,
                          Bindings *bindings, bool *ok) {
    if (pattern->IsSymbol()) {
        auto name = pattern->AsSymbol()->name();
        if (name != "_") {
            (*bindings)[name] = input;
        }
        return true;
    }

    if (pattern->IsPair()) {
        ValueList patterns, inputs;
        pattern->AsPair()->ToVector(&patterns);
        if (!input->IsPair() || !input->AsPair()->ToVector(&inputs) ||
            inputs.size() != patterns.size()) {
            evaluator_->ThrowError(ERR_SIGNATURE_MISMATCH, "pattern match "
                                   "failure: expected `%s', found `%s'",
                                   pattern->ToString().c_str(),
                                   input->ToString().c_str());
            *ok = false;
            return false;
        }
        for (size_t i = 0; i < patterns.size(); ++i) {
            Match(patterns[i].get(), inputs[i], bindings, CHECK_OK);
        }
        return true;
    }

    if (!ValueEquals(pattern, input.get())) {
        evaluator_->ThrowError(ERR_SIGNATURE_MISMATCH, "pattern match failure: "
                               "expected `%s', found `%s'",
                               pattern->ToString().c_str(),
                               input->ToString().c_str());
        *ok = false;
        return false;
    }
    return true;
}

Handle<Value> MacroExpander::Substitute(Handle<Value> templ,
                                        const Bindings &bindings) {
    if (templ->IsSymbol()) {
        auto iter = bindings.find(templ->AsSymbol()->name());
        return iter == bindings.end() ? templ : iter->second;
    }
    if (!templ->IsPair()) {
        return templ;
    }
    auto pair = templ->AsPair();
    auto car = Substitute(pair->car(), bindings);
    auto cdr = Substitute(pair->cdr(), bindings);
    return evaluator_->values()->NewPair(car, cdr);
}

// Parameters are bound to the call-site terms, the body computes the
// expansion.
Handle<Value> MacroExpander::ExpandTemplate(Macro *macro,
                                            const ValueList &args,
                                            bool *ok) {
    ValueList params;
    ListElements(macro->pattern().get(), &params);
    DCHECK_EQ(params.size(), args.size());

    Handle<Environment> frame(new Environment(macro->env()));
    for (size_t i = 0; i < params.size(); ++i) {
        auto name = params[i]->AsSymbol()->name();
        if (!frame->Define(name, args[i])) {
            evaluator_->ThrowError(ERR_RESERVED_IDENTIFIER, "%s",
                                   name.c_str());
            *ok = false;
            return nullptr;
        }
    }
    return evaluator_->Eval(macro->body(), frame, ok);
}

Handle<Value> MacroExpander::ExpandRule(Macro *macro, const ValueList &args,
                                        bool *ok) {
    ValueList patterns;
    ListElements(macro->pattern().get(), &patterns);
    DCHECK_EQ(patterns.size(), args.size());

    Bindings bindings;
    for (size_t i = 0; i < patterns.size(); ++i) {
        Match(patterns[i].get(), args[i], &bindings, CHECK_OK);
    }
    return Substitute(macro->body(), bindings);
}

} // namespace rlisp
