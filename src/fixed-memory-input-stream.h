#ifndef RLISP_FIXED_MEMORY_INPUT_STREAM_H_
#define RLISP_FIXED_MEMORY_INPUT_STREAM_H_

#include "text-input-stream.h"
#include <unordered_map>

namespace rlisp {

class FixedMemoryInputStream : public TextInputStream {
public:
    FixedMemoryInputStream(const char *buf, size_t len);
    explicit FixedMemoryInputStream(const char *z);
    explicit FixedMemoryInputStream(const std::string &s);

    virtual ~FixedMemoryInputStream();

    virtual const char *file_name() const override;
    virtual bool eof() override;
    virtual std::string error() override;
    virtual int ReadOne() override;

    DISALLOW_IMPLICIT_CONSTRUCTORS(FixedMemoryInputStream);
private:
    std::string buf_;
    size_t position_ = 0;
}; // class FixedMemoryInputStream


/**
 * Source texts keyed by name, for tests and embedded programs. A key can
 * be opened more than once.
 */
class FixedMemoryStreamFactory : public TextStreamFactory {
public:
    FixedMemoryStreamFactory();
    virtual ~FixedMemoryStreamFactory();

    void PutInputStream(const std::string &name, const std::string &content);

    virtual TextInputStream *GetInputStream(const std::string &key) override;

    DISALLOW_IMPLICIT_CONSTRUCTORS(FixedMemoryStreamFactory)
private:
    std::unordered_map<std::string, std::string> contents_;
}; // class FixedMemoryStreamFactory

} // namespace rlisp

#endif // RLISP_FIXED_MEMORY_INPUT_STREAM_H_
