#pragma once

#include <optional>

#include "api/songqueue/v1.hpp"
#include "internal/db/api/types.hpp"
#include "internal/db/model/request_record.hpp"
#include "internal/db/model/track_record.hpp"
#include "internal/db/model/venue_record.hpp"
#include "internal/session/session_resolver.hpp"

namespace songqueue::service {

songqueue::v1::RequestStatus ToProto(songqueue::model::RequestStatus status);

// UNSPECIFIED maps to nullopt; unknown values throw InvalidArgument.
std::optional<songqueue::model::RequestStatus> FromProto(songqueue::v1::RequestStatus status);

songqueue::v1::SongRequest  ToProto(const db::model::RequestRecord& record);
songqueue::v1::Venue        ToProto(const db::model::VenueRecord& record);
songqueue::v1::Track        ToProto(const db::model::TrackRecord& record);
songqueue::v1::StatusCounts ToProto(const db::StatusCounts& counts);

db::model::VenueRecord FromProto(const songqueue::v1::Venue& venue);
db::model::TrackRecord FromProto(const songqueue::v1::Track& track);

session::CallerIdentity FromProto(const songqueue::v1::CallerContext& caller);

} // namespace songqueue::service
