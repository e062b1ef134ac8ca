#include "awsid/Copyright.hpp"
#pragma once
/**
 * everything needed to use the id types: the 28 general format ids, the
 * region id, the runtime registry and property_tree support
 */
#include "awsid/GeneralResource.hpp"
#include "awsid/Region.hpp"
#include "awsid/Registry.hpp"
#include "awsid/Serialization.hpp"
