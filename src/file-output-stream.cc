#include "file-output-stream.h"
#include "glog/logging.h"
#include <errno.h>
#include <string.h>

namespace rlisp {

FileOutputStream::FileOutputStream(const std::string &file_name, FILE *fp,
                                   bool ownership)
    : file_name_(file_name)
    , fp_(DCHECK_NOTNULL(fp))
    , ownership_(ownership) {}

/*virtual*/ FileOutputStream::~FileOutputStream() {
    if (fp_ && ownership_) {
        fclose(fp_);
    }
}

/*virtual*/ const char *FileOutputStream::file_name() const {
    return file_name_.c_str();
}

/*virtual*/ std::string FileOutputStream::error() {
    if (errno_ == 0) {
        return std::string();
    }
    return std::string(strerror(errno_));
}

/*virtual*/ int FileOutputStream::Write(const char *z, int n) {
    if (n <= 0) {
        return 0;
    }
    auto rv = fwrite(z, 1, n, fp_);
    if (rv < static_cast<size_t>(n)) {
        errno_ = errno ? errno : EIO;
        DLOG(ERROR) << "write " << file_name_ << " fail: " << error();
    }
    return static_cast<int>(rv);
}

/*virtual*/ bool FileOutputStream::Flush() {
    if (fflush(fp_) != 0) {
        errno_ = errno ? errno : EIO;
        return false;
    }
    return true;
}

TextOutputStream *CreateStdoutOutputStream() {
    return new FileOutputStream("[:stdout:]", stdout, false);
}

} // namespace rlisp
