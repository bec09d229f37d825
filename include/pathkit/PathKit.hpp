#pragma once

#include "config/PathConfiguration.hpp"
#include "core/Error.hpp"
#include "core/FileSystem.hpp"
#include "name/Name.hpp"
#include "name/Normalization.hpp"
#include "path/Path.hpp"
#include "path/PathMatcher.hpp"
#include "path/PathService.hpp"
#include "path/PathType.hpp"
