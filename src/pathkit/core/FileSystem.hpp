#pragma once
#include <string_view>

namespace PK {

/**
 * Identity of the file system that owns a PathService. PathKit never calls
 * into the file system; paths only report which instance they belong to.
 */
class FileSystem {
public:
    virtual ~FileSystem() = default;

    virtual auto identity() const -> std::string_view = 0;
};

} // namespace PK
