#include "file-input-stream.h"
#include "glog/logging.h"
#include <errno.h>
#include <string.h>

namespace rlisp {

namespace {

class ErrorInputStream : public TextInputStream {
public:
    ErrorInputStream(const std::string &file_name, const std::string &message)
        : file_name_(file_name)
        , message_(message) {}

    virtual ~ErrorInputStream() {}

    virtual const char *file_name() const override { return file_name_.c_str(); }
    virtual bool eof() override { return true; }
    virtual std::string error() override { return message_; }
    virtual int ReadOne() override { return -1; }

    DISALLOW_IMPLICIT_CONSTRUCTORS(ErrorInputStream);
private:
    std::string file_name_;
    std::string message_;
};

std::string ErrnoMessage(int err) {
    char buf[256];
    // GNU and XSI strerror_r differ, strerror is enough in one thread.
    snprintf(buf, arraysize(buf), "%s", strerror(err));
    return std::string(buf);
}

} // namespace

////////////////////////////////////////////////////////////////////////////////
//// FileInputStream
////////////////////////////////////////////////////////////////////////////////

FileInputStream::FileInputStream(const std::string &file_name, FILE *fp,
                                 bool ownership)
    : fp_(DCHECK_NOTNULL(fp))
    , ownership_(ownership)
    , file_name_(file_name) {}

/*virtual*/ FileInputStream::~FileInputStream() {
    if (fp_ && ownership_) {
        fclose(fp_);
    }
}

/*virtual*/ const char *FileInputStream::file_name() const {
    return file_name_.c_str();
}

/*virtual*/ bool FileInputStream::eof() {
    return feof(fp_);
}

/*virtual*/ std::string FileInputStream::error() {
    if (errno_ == 0) {
        return std::string();
    }
    return ErrnoMessage(errno_);
}

/*virtual*/ int FileInputStream::ReadOne() {
    auto ch = fgetc(fp_);
    if (ch == EOF && ferror(fp_)) {
        errno_ = errno ? errno : EIO;
        DLOG(ERROR) << "read " << file_name_ << " fail: " << error();
    }
    return ch == EOF ? -1 : ch;
}

////////////////////////////////////////////////////////////////////////////////
//// FileStreamFactory
////////////////////////////////////////////////////////////////////////////////

FileStreamFactory::FileStreamFactory() {
}

/*virtual*/ FileStreamFactory::~FileStreamFactory() {
}

/*virtual*/
TextInputStream *FileStreamFactory::GetInputStream(const std::string &key) {
    auto fp = fopen(key.c_str(), "r");
    if (!fp) {
        return new ErrorInputStream(key, ErrnoMessage(errno));
    }

    return new FileInputStream(key, fp, true);
}

TextStreamFactory *CreateFileStreamFactory() {
    return new FileStreamFactory();
}

TextInputStream *CreateStdinInputStream() {
    return new FileInputStream("[:stdin:]", stdin, false);
}

} // namespace rlisp
