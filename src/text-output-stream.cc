#include "text-output-stream.h"
#include <stdio.h>

namespace rlisp {

int TextOutputStream::Printf(const char *fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    auto rv = Vprintf(fmt, ap);
    va_end(ap);
    return rv;
}

int TextOutputStream::Vprintf(const char *fmt, va_list ap) {
    auto rv = TextOutputStream::vsprintf(fmt, ap);
    return Write(rv.data(), static_cast<int>(rv.size()));
}

/*static*/ std::string TextOutputStream::sprintf(const char *fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    auto rv = TextOutputStream::vsprintf(fmt, ap);
    va_end(ap);
    return rv;
}

/*static*/ std::string TextOutputStream::vsprintf(const char *fmt, va_list ap) {
    va_list copied;
    va_copy(copied, ap);
    auto len = vsnprintf(nullptr, 0, fmt, copied);
    va_end(copied);
    if (len <= 0) {
        return std::string();
    }

    std::string buf(static_cast<size_t>(len) + 1, 0);
    vsnprintf(&buf[0], buf.size(), fmt, ap);
    buf.resize(static_cast<size_t>(len));
    return buf;
}

} // namespace rlisp
