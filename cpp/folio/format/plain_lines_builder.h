#ifndef FOLIO_FORMAT_PLAIN_LINES_BUILDER_H
#define FOLIO_FORMAT_PLAIN_LINES_BUILDER_H

#include "folio/document.h"
#include <string>
#include <vector>

namespace folio::format {

/**
 * Flattens blocks into unwrapped plain strings, one per paragraph (one per
 * physical row for code and tables), blank strings between blocks.
 */
class PlainLinesBuilder {
public:
    static std::vector<std::string> build(const BlockList& blocks);
};

} // namespace folio::format

#endif // FOLIO_FORMAT_PLAIN_LINES_BUILDER_H
