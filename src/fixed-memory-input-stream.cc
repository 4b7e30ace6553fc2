#include "fixed-memory-input-stream.h"
#include <string.h>

namespace rlisp {

namespace {

class ErrorInputStream : public TextInputStream {
public:
    explicit ErrorInputStream(const std::string &message) : message_(message) {}
    virtual ~ErrorInputStream() {}

    virtual const char *file_name() const override { return "[:error:]"; }
    virtual bool eof() override { return true; }
    virtual std::string error() override { return message_; }
    virtual int ReadOne() override { return -1; }

    DISALLOW_IMPLICIT_CONSTRUCTORS(ErrorInputStream);
private:
    std::string message_;
};

} // namespace

FixedMemoryInputStream::FixedMemoryInputStream(const char *buf, size_t len)
    : buf_(buf, len) {
}

FixedMemoryInputStream::FixedMemoryInputStream(const char *z)
    : FixedMemoryInputStream(z, strlen(z)) {
}

FixedMemoryInputStream::FixedMemoryInputStream(const std::string &s)
    : buf_(s) {
}

/*virtual*/ FixedMemoryInputStream::~FixedMemoryInputStream() {
}

/*virtual*/ const char *FixedMemoryInputStream::file_name() const  {
    return "[:memory:]";
}

/*virtual*/ bool FixedMemoryInputStream::eof() {
    return position_ >= buf_.size();
}

/*virtual*/ std::string FixedMemoryInputStream::error() {
    return std::string();
}

/*virtual*/ int FixedMemoryInputStream::ReadOne() {
    if (position_ >= buf_.size()) {
        return -1;
    }
    return static_cast<unsigned char>(buf_[position_++]);
}

FixedMemoryStreamFactory::FixedMemoryStreamFactory() {
}

/*virtual*/ FixedMemoryStreamFactory::~FixedMemoryStreamFactory() {
}

void FixedMemoryStreamFactory::PutInputStream(const std::string &name,
                                              const std::string &content) {
    contents_[name] = content;
}

/*virtual*/
TextInputStream *
FixedMemoryStreamFactory::GetInputStream(const std::string &key) {
    auto iter = contents_.find(key);
    if (iter == contents_.end()) {
        return new ErrorInputStream("key not found: " + key);
    }
    return new FixedMemoryInputStream(iter->second);
}

} // namespace rlisp
