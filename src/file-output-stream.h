#ifndef RLISP_FILE_OUTPUT_STREAM_H_
#define RLISP_FILE_OUTPUT_STREAM_H_

#include "text-output-stream.h"
#include <stdio.h>

namespace rlisp {

class FileOutputStream : public TextOutputStream {
public:
    /**
     * If `ownership' is true, the `fp' will be closed at destruction.
     */
    FileOutputStream(const std::string &file_name, FILE *fp, bool ownership);

    virtual ~FileOutputStream() override;
    virtual const char *file_name() const override;
    virtual std::string error() override;
    virtual int Write(const char *z, int n) override;
    virtual bool Flush() override;

    DISALLOW_IMPLICIT_CONSTRUCTORS(FileOutputStream)
private:
    std::string file_name_;
    FILE *fp_;
    bool ownership_;
    int errno_ = 0;
};

TextOutputStream *CreateStdoutOutputStream();

} // namespace rlisp

#endif // RLISP_FILE_OUTPUT_STREAM_H_
