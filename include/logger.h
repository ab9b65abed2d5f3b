#pragma once

#include <iostream>

#define LOG_INFO(x) std::cout << x << std::endl
#define LOG_WARNING(x) std::cerr << "Warning: " << x << std::endl
#define LOG_ERROR(x) std::cerr << "Error: " << x << std::endl

#ifdef VASPFLOW_DEBUG
#define DEBUG_PRINT(x) std::cerr << x << std::endl
#else
#define DEBUG_PRINT(x)
#endif
