#ifndef RLISP_TEXT_INPUT_STREAM_H_
#define RLISP_TEXT_INPUT_STREAM_H_

#include "base.h"
#include <string>

namespace rlisp {

class TextInputStream {
public:
    TextInputStream() = default;
    virtual ~TextInputStream();

    virtual const char *file_name() const = 0;

    virtual bool eof() = 0;

    /**
     * Empty string means no error.
     */
    virtual std::string error() = 0;

    /**
     * Read one char from stream.
     * EOF = -1
     */
    virtual int ReadOne() = 0;

    /**
     * Read chars until '\n' or EOF, the '\n' is not included.
     * Returns false if EOF was reached before any char was read.
     */
    bool ReadLine(std::string *line);

    DISALLOW_IMPLICIT_CONSTRUCTORS(TextInputStream)
};

class TextStreamFactory {
public:
    TextStreamFactory() = default;
    virtual ~TextStreamFactory();

    /**
     * Never returns `nullptr', failures are reported by a stream whose
     * `error()' is not empty.
     */
    virtual TextInputStream *GetInputStream(const std::string &key) = 0;

    DISALLOW_IMPLICIT_CONSTRUCTORS(TextStreamFactory)
};

TextStreamFactory *CreateFileStreamFactory();

TextInputStream *CreateStdinInputStream();

} // namespace rlisp

#endif // RLISP_TEXT_INPUT_STREAM_H_
