#pragma once

// Standard C++ Library - Most frequently used
#include <string>
#include <vector>
#include <map>
#include <set>
#include <unordered_map>
#include <algorithm>
#include <iostream>
#include <fstream>
#include <sstream>
#include <filesystem>
#include <optional>

// Additional commonly used headers
#include <iomanip>
#include <cctype>

// Core project types - used by almost every file
#include "common/project_types.hpp"
