#include "memory-output-stream.h"

namespace rlisp {

/*virtual*/ const char *MemoryOutputStream::file_name() const {
    return "[:memory:]";
}

/*virtual*/ std::string MemoryOutputStream::error() {
    return flush_fail_ ? "flush failed" : "";
}

/*virtual*/ int MemoryOutputStream::Write(const char *z, int n) {
    buf_->append(z, n);
    return n;
}

/*virtual*/ bool MemoryOutputStream::Flush() {
    return !flush_fail_;
}

} // namespace rlisp
