/*
 * CredaCash (TM) cryptocurrency and blockchain
 *
 * Copyright (C) 2015-2025 Creda Foundation, Inc., or its contributors
 *
 * HLdef.h
*/

#pragma once

#include <cstdlib>
#include <cstdint>
#include <limits>
#include <climits>
#include <cctype>
#include <string>
#include <cstring>
#include <array>
#include <vector>
#include <map>
#include <memory>
#include <algorithm>
#include <sstream>
#include <fstream>
#include <iostream>
#include <iomanip>
#include <thread>
#include <mutex>
#include <exception>
#include <stdexcept>
#include <random>
#include <utility>
#include <chrono>

#include <unistd.h>
#include <string.h>
#include <fcntl.h>
#include <sys/types.h>
#include <sys/stat.h>

using namespace std;

#define DEFAULT_TRACE_LEVEL		3

#include <boost/version.hpp>

#include "HLutil.h"
#include "HLticks.hpp"
#include "HLassert.h"
