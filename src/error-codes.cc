#include "error-codes.h"
#include "glog/logging.h"
#include <stdio.h>

namespace rlisp {

static const ErrorCodeMetadata kErrorCodeMetadata[] = {
    { ERR_NONE, "NONE", "" },
#define ErrorCodeMetadata_GLOBAL_DEFINE(name, code, text) \
    { ERR_##name, #name, text, },
    DEFINE_ERROR_CODES(ErrorCodeMetadata_GLOBAL_DEFINE)
#undef ErrorCodeMetadata_GLOBAL_DEFINE
};

static_assert(arraysize(kErrorCodeMetadata) == kMaxErrorCode + 1,
              "error catalog must be dense");

const char *ErrorCodeDescription(int code) {
    if (!IsValidErrorCode(code)) {
        return nullptr;
    }
    auto metadata = &kErrorCodeMetadata[code];
    DCHECK_EQ(code, static_cast<int>(metadata->code));
    return metadata->description;
}

const char *ErrorCodeName(int code) {
    if (!IsValidErrorCode(code)) {
        return nullptr;
    }
    return kErrorCodeMetadata[code].name;
}

std::string ErrorCodeToString(int code) {
    char buf[128];
    auto description = ErrorCodeDescription(code);
    snprintf(buf, arraysize(buf), "error(%03d): %s", code,
             description ? description : "unknown error");
    return std::string(buf);
}

} // namespace rlisp
