#pragma once

#include <set>
#include <string>

#include "google/protobuf/struct.pb.h"

namespace tasktree::indexing {

// Relationship fields that may legitimately carry null.
const std::set<std::string>& NullableRelationshipFields();

/*
  Removes values the vector store must never see:
    - unset values ("undefined")
    - empty strings
    - NaN / infinite numbers
    - nulls, except for top-level nullable relationship fields
  Nested structs and lists are cleaned recursively.
*/
google::protobuf::Struct SanitizePayload(const google::protobuf::Struct& payload,
                                         const std::set<std::string>& nullable = NullableRelationshipFields());

} // namespace tasktree::indexing
