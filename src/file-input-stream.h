#ifndef RLISP_FILE_INPUT_STREAM_H_
#define RLISP_FILE_INPUT_STREAM_H_

#include "text-input-stream.h"
#include <stdio.h>

namespace rlisp {

class FileInputStream : public TextInputStream {
public:
    /**
     * If `ownership' is true, the `fp' will be closed at destruction.
     */
    FileInputStream(const std::string &file_name, FILE *fp, bool ownership);

    virtual ~FileInputStream() override;
    virtual const char *file_name() const override;
    virtual bool eof() override;
    virtual std::string error() override;
    virtual int ReadOne() override;

    DISALLOW_IMPLICIT_CONSTRUCTORS(FileInputStream);
private:
    FILE *fp_ = nullptr;
    bool ownership_;
    int errno_ = 0;
    std::string file_name_;
}; // class FileInputStream


class FileStreamFactory : public TextStreamFactory {
public:
    FileStreamFactory();

    virtual ~FileStreamFactory() override;
    virtual TextInputStream *GetInputStream(const std::string &key) override;

    DISALLOW_IMPLICIT_CONSTRUCTORS(FileStreamFactory)
}; // class FileStreamFactory

} // namespace rlisp

#endif // RLISP_FILE_INPUT_STREAM_H_
