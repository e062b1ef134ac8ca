#include "awsid/Copyright.hpp"
#pragma once

#ifndef awsid_unlikely
#define awsid_unlikely(x)     __builtin_expect(!!(x),0)
#endif
