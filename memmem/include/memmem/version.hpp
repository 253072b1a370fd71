#pragma once

#define MEMMEM_VERSION "0.4.0"

// Bump when the on-disk schema changes incompatibly
#define MEMMEM_SCHEMA_VERSION 3
