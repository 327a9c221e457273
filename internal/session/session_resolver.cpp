#include "session_resolver.hpp"

#include "internal/db/api/error_translation.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace songqueue::session {

using songqueue::observability::BoolField;
using songqueue::observability::StringField;

namespace {

void Validate(const CallerIdentity& caller, const std::string& venue_id) {
  if (venue_id.empty()) {
    throw util::InvalidArgument("venue id is required");
  }
  if (caller.Empty()) {
    throw util::InvalidArgument("caller needs an account id, table tag or client address");
  }
}

} // namespace

SessionResolver::SessionResolver(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

std::optional<db::model::PatronRecord> SessionResolver::Match(db::Transaction& tx, const CallerIdentity& caller,
                                                              const std::string& venue_id) {
  if (!caller.account_id.empty()) {
    return repository_->FindPatronByAccount(tx, venue_id, caller.account_id);
  }
  return repository_->FindPatronBySession(tx, venue_id, caller.table_tag, caller.client_address);
}

std::string SessionResolver::ResolvePatron(const CallerIdentity& caller, const std::string& venue_id) {
  Validate(caller, venue_id);

  std::lock_guard<std::mutex> lock(create_mutex_);
  return db::WithStorage("resolve patron", [&] {
    auto tx = repository_->Begin();
    if (!repository_->GetVenue(*tx, venue_id)) {
      throw util::NotFound("venue not found: " + venue_id);
    }

    const auto now = util::NowMillis();
    if (auto patron = Match(*tx, caller, venue_id)) {
      patron->last_seen_ms = now;
      if (!caller.table_tag.empty()) patron->table_tag = caller.table_tag;
      if (!caller.client_address.empty()) patron->client_address = caller.client_address;
      db::ThrowIfDbError(repository_->UpdatePatron(*tx, *patron), "touch patron");
      tx->Commit();
      return patron->id;
    }

    db::model::PatronRecord created;
    created.id             = util::NewId();
    created.venue_id       = venue_id;
    created.account_id     = caller.account_id;
    created.table_tag      = caller.table_tag;
    created.client_address = caller.client_address;
    created.created_at_ms  = now;
    created.last_seen_ms   = now;
    db::ThrowIfDbError(repository_->InsertPatron(*tx, created), "create patron");
    tx->Commit();

    SONGQUEUE_LOG_INFO("patron created", {StringField("patron_id", created.id), StringField("venue_id", venue_id),
                                          BoolField("registered", !caller.account_id.empty())});
    return created.id;
  });
}

std::optional<std::string> SessionResolver::FindPatron(const CallerIdentity& caller, const std::string& venue_id) {
  Validate(caller, venue_id);

  return db::WithStorage("find patron", [&]() -> std::optional<std::string> {
    auto tx     = repository_->Begin();
    auto patron = Match(*tx, caller, venue_id);
    if (!patron) return std::nullopt;
    return patron->id;
  });
}

} // namespace songqueue::session
