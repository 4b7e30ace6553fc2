#include "text-input-stream.h"
#include "glog/logging.h"

namespace rlisp {

/*virtual*/ TextInputStream::~TextInputStream() {
}

bool TextInputStream::ReadLine(std::string *line) {
    DCHECK_NOTNULL(line)->clear();

    auto ch = ReadOne();
    if (ch == -1) {
        return false;
    }
    while (ch != -1 && ch != '\n') {
        line->append(1, static_cast<char>(ch));
        ch = ReadOne();
    }
    return true;
}

/*virtual*/ TextStreamFactory::~TextStreamFactory() {
}

} // namespace rlisp
