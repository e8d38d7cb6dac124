#pragma once

#include <crow.h>

namespace dnspub::core {
class PublishDnsUpdatesAction;
}

namespace dnspub::security {
class TaskSignatureVerifier;
}

namespace dnspub::api::routes {

/// Handler for POST /_dr/task/publishDnsUpdates
/// Class abbreviation: pr
class PublishRoutes {
 public:
  PublishRoutes(core::PublishDnsUpdatesAction& pdaAction,
                const security::TaskSignatureVerifier& tsvVerifier);
  ~PublishRoutes();

  void registerRoutes(crow::SimpleApp& app);

  /// Any non-200 makes the task transport redeliver the batch.
  crow::response handlePublish(const crow::request& req);

 private:
  core::PublishDnsUpdatesAction& _pdaAction;
  const security::TaskSignatureVerifier& _tsvVerifier;
};

}  // namespace dnspub::api::routes
