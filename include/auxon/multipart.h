#ifndef AUXON_MULTIPART_H
#define AUXON_MULTIPART_H

#include <string>
#include <string_view>
#include <vector>

#include "auxon/status.h"

namespace auxon {

// One part of a multipart/form-data body. body views into the request
// buffer passed to parseMultipart and lives no longer than it.
struct MultipartPart {
    std::string name;
    std::string filename;
    std::string contentType;
    std::string_view body;
};

// Extracts the boundary parameter from a multipart/form-data Content-Type.
bool parseBoundary(std::string_view contentType, std::string& boundary);

Status parseMultipart(std::string_view body, const std::string& boundary,
                      std::vector<MultipartPart>& parts);

// The part named field, otherwise the first part carrying a filename.
const MultipartPart* findFilePart(const std::vector<MultipartPart>& parts, const std::string& field);

} // namespace auxon

#endif // AUXON_MULTIPART_H
