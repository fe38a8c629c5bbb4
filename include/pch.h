#pragma once

#include <toolscout/base/files.h>
#include <toolscout/base/fmt.h>
#include <toolscout/base/messages.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <cstddef>
#include <iterator>
#include <map>
#include <string>
#include <system_error>
#include <type_traits>
#include <utility>
#include <vector>
