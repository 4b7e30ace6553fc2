#include "special-forms.h"
#include "base.h"
#include "glog/logging.h"
#include <unordered_map>

namespace rlisp {

namespace {

const char *kSpecialFormNames[] = {
#define SpecialForm_NAME(code, name, literal) literal,
    DEFINE_SPECIAL_FORMS(SpecialForm_NAME)
#undef SpecialForm_NAME
};

class SpecialFormTable {
public:
    SpecialFormTable() {
        for (size_t i = 0; i < arraysize(kSpecialFormNames); ++i) {
            forms_[kSpecialFormNames[i]] = static_cast<SpecialForm>(i);
        }
        forms_["\xce\xbb"] = FORM_LAMBDA; // λ
    }

    SpecialForm Find(const std::string &name) const {
        auto iter = forms_.find(name);
        return iter == forms_.end() ? FORM_NONE : iter->second;
    }

private:
    std::unordered_map<std::string, SpecialForm> forms_;
};

const SpecialFormTable *GetTable() {
    static const SpecialFormTable table;
    return &table;
}

} // namespace

SpecialForm FindSpecialForm(const std::string &name) {
    return GetTable()->Find(name);
}

const char *SpecialFormName(SpecialForm form) {
    DCHECK_GE(form, 0);
    DCHECK_LT(form, FORM_NONE);
    return kSpecialFormNames[form];
}

bool IsReservedIdentifier(const std::string &name) {
    return name == "else" || name == "_" || FindSpecialForm(name) != FORM_NONE;
}

} // namespace rlisp
