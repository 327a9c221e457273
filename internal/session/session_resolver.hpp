#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "internal/db/api/repository.hpp"

namespace songqueue::session {

// Who is calling. Either account_id or one of table_tag / client_address.
struct CallerIdentity {
  std::string account_id;
  std::string table_tag;
  std::string client_address;

  bool Empty() const {
    return account_id.empty() && table_tag.empty() && client_address.empty();
  }
};

/*
  Maps a caller to a patron id scoped to one venue.

  - account present: the patron bound to that account in the venue
  - otherwise: the most recent anonymous patron with the same table tag
    or client address

  ResolvePatron creates the patron when none matches. Creation is
  serialised so concurrent resolutions of one session yield one patron.
*/
class SessionResolver {
 public:
  explicit SessionResolver(std::shared_ptr<db::Repository> repository);

  std::string ResolvePatron(const CallerIdentity& caller, const std::string& venue_id);

  // Lookup only; never creates.
  std::optional<std::string> FindPatron(const CallerIdentity& caller, const std::string& venue_id);

 private:
  std::optional<db::model::PatronRecord> Match(db::Transaction& tx, const CallerIdentity& caller, const std::string& venue_id);

  std::shared_ptr<db::Repository> repository_;
  std::mutex                      create_mutex_;
};

} // namespace songqueue::session
