#pragma once

#include <stdio.h>
#include <stdarg.h>
#include <stdint.h>
#include <stdlib.h>
#include <string.h>
#include <errno.h>
#include <time.h>
#include <math.h>
#include <float.h>
#include <sys/stat.h>

#include <cmath>
#include <vector>
#include <deque>
#include <unordered_map>
#include <set>
#include <map>
#include <algorithm>
#include <unordered_set>
#include <functional>
#include <iterator>
#include <memory>
#include <string>

typedef uint8_t u8;
typedef uint16_t u16;
typedef uint32_t u32;
typedef uint64_t u64;

typedef int8_t s8;
typedef int16_t s16;
typedef int32_t s32;
typedef int64_t s64;

using std::vector;
using std::string;
using std::pair;
using std::make_pair;
using std::hash;
using std::min;
using std::max;
using std::unordered_map;
using std::unordered_set;
using std::function;
using std::initializer_list;
using std::map;
using std::deque;
using std::shared_ptr;
using std::unique_ptr;
using std::make_unique;
