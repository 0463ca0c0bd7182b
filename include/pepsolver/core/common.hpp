#pragma once

// Standard headers shared by the pepsolver library, tests and driver.

// containers
#include <vector>
#include <deque>
#include <string>
#include <map>
#include <utility>
#include <tuple>
#include <functional>
#include <memory>

// numerics (INFINITY comes from <cmath>)
#include <cmath>
#include <algorithm>
#include <numeric>
#include <limits>
#include <cstdint>
#include <random>

// io and errors
#include <iostream>
#include <sstream>
#include <fstream>
#include <cstdio>
#include <stdexcept>
