// VESCROW - Serialization Implementation
// Copyright (c) 2024 VESCROW Developers
// MIT License

#include "vescrow/core/serialize.h"
#include "vescrow/core/hex.h"

namespace vescrow {

// ============================================================================
// DataStream Implementation
// ============================================================================

std::string DataStream::ToHex() const {
    return BytesToHex(data_.data() + read_pos_, data_.size() - read_pos_);
}

} // namespace vescrow
