#include "token.h"
#include "glog/logging.h"
#include <stdio.h>

namespace rlisp {

static const TokenMetadata kTokenMetadata[] = {
#define TokenMetadata_GLOBAL_DEFINE(token, txt) \
    { TOKEN_##token, #token, txt, },
    DEFINE_TOKENS(TokenMetadata_GLOBAL_DEFINE)
#undef TokenMetadata_GLOBAL_DEFINE
};

std::string TokenNameWithText(Token token) {
    DCHECK_GE(static_cast<int>(token), 0);
    DCHECK_LT(static_cast<size_t>(token), arraysize(kTokenMetadata));
    auto metadata = &kTokenMetadata[static_cast<int>(token)];

    if (metadata->text[0] == '\0') {
        return std::string(metadata->name);
    }

    char buf[128];
    snprintf(buf, arraysize(buf), "%s `%s\'", metadata->name, metadata->text);
    return std::string(buf);
}

TokenObject::TokenObject() {
    Reset();
}

TokenObject::~TokenObject() {
}

std::string TokenObject::ToNameWithText() const {
    switch (token_code_) {
        case TOKEN_SYMBOL:
        case TOKEN_INT_LITERAL:
        case TOKEN_FLOAT_LITERAL: {
            char buf[128];
            snprintf(buf, arraysize(buf), "%s `%s\'",
                     kTokenMetadata[token_code_].name, text_.c_str());
            return std::string(buf);
        }
        default:
            break;
    }
    return TokenNameWithText(token_code_);
}

void TokenObject::Reset() {
    token_code_ = TOKEN_ERROR;
    position_   = -1;
    len_        = -1;
    line_       = 0;
    column_     = 0;
    int_data_   = 0;
    float_data_ = 0;
    error_code_ = 0;
    text_.clear();
    spans_.clear();
}

} // namespace rlisp
