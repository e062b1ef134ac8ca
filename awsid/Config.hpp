#include "awsid/Copyright.hpp"
#pragma once
/**
 * this file is for internal use, don't change
 */
#include <stdint.h>

/// suffix length of the ids issued before 2016
#ifndef AWSID_SHORT_SUFFIX_LEN
#define AWSID_SHORT_SUFFIX_LEN 8u
#endif

/// suffix length of the ids issued since 2016
#ifndef AWSID_LONG_SUFFIX_LEN
#define AWSID_LONG_SUFFIX_LEN 17u
#endif

/// storage footprint of every general format id: the suffix plus its length byte
#define AWSID_GENERAL_ID_BYTES (AWSID_LONG_SUFFIX_LEN + 1u)

static_assert(AWSID_SHORT_SUFFIX_LEN < AWSID_LONG_SUFFIX_LEN
    , "short suffix must be shorter than the long one");
static_assert(AWSID_LONG_SUFFIX_LEN < 256u, "suffix length is kept in one byte");
