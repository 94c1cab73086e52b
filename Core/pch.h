#pragma once

#include <cstdint>
#include <cstring>
#include <string>
#include <vector>
#include <list>
#include <memory>
#include <atomic>
#include <sstream>
#include <iostream>
#include <algorithm>
#include <unordered_map>
#include <format>

using std::string;
using std::vector;
using std::list;
using std::atomic;
using std::atomic_flag;
using std::stringstream;
using std::istream;
using std::ostream;
