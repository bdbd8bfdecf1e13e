#pragma once
// fxd: persistence core for a node-addressable graph store
//
// - Value: tagged union mirroring the UArr type tags
// - UArr: self-describing binary records, zero-copy field access
// - WAL: append-only checksummed record log with ordered replay
// - Disk: save/load/compact of the live graph over the WAL
// - Signals: append-only mutation stream with cursor subscriptions
// - Config: JSON configuration for all of the above

#include "version.hpp"
#include "errors.hpp"
#include "types.hpp"
#include "value.hpp"
#include "uarr.hpp"
#include "wal.hpp"
#include "graph.hpp"
#include "snippet_index.hpp"
#include "disk.hpp"
#include "signals.hpp"
#include "config.hpp"
