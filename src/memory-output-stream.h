#ifndef RLISP_MEMORY_OUTPUT_STREAM_H_
#define RLISP_MEMORY_OUTPUT_STREAM_H_

#include "text-output-stream.h"
#include "glog/logging.h"
#include <string>

namespace rlisp {

/**
 * Collect output into a string, the string is owned by caller.
 */
class MemoryOutputStream : public TextOutputStream {
public:
    explicit MemoryOutputStream(std::string *buf) : buf_(DCHECK_NOTNULL(buf)) {}

    virtual ~MemoryOutputStream() override = default;
    virtual const char *file_name() const override;
    virtual std::string error() override;
    virtual int Write(const char *z, int n) override;
    virtual bool Flush() override;

    void set_flush_fail(bool fail) { flush_fail_ = fail; }

    DISALLOW_IMPLICIT_CONSTRUCTORS(MemoryOutputStream)
private:
    std::string *buf_;
    bool flush_fail_ = false;
};

} // namespace rlisp

#endif // RLISP_MEMORY_OUTPUT_STREAM_H_
