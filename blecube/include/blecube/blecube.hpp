#pragma once
// BleCube: multi-dimensional index for BLE observations
//
// - Types: Observation, MacAddress, RecordId
// - Indices: MAC (hashed), RSSI and timestamp (ordered), geo (R-tree)
// - Geo: haversine distance, envelopes, ray casting
// - Cube: insert, single-dimension and conjunctive queries
// - JSON: observation codec and loaders

#include "version.hpp"
#include "types.hpp"
#include "log.hpp"
#include "geo.hpp"
#include "cube.hpp"
#include "json.hpp"
