#include "session_binding.h"

#include <spdlog/spdlog.h>

namespace gridlink {
namespace services {

SessionBinding::SessionBinding(transport::ITransport& client, session::Session& session)
  : _client(client)
  , _session(session)
  , _filters()
  , _attached(false)
{
}

SessionBinding::~SessionBinding() {
  release();
}

bool SessionBinding::attach(const std::vector<std::string>& filters, Error& error) {
  if (!_attached) {
    _client.setMessageHandler(
        transport::MessageHandler::create<session::Session, &session::Session::post>(_session));
    _attached = true;
  }
  for (size_t i = 0; i < filters.size(); ++i) {
    if (!add(filters[i], error)) {
      release();
      return false;
    }
  }
  return true;
}

bool SessionBinding::add(const std::string& filter, Error& error) {
  if (!_attached) {
    error = Error(ErrorCode::TRANSPORT, "binding not attached");
    return false;
  }
  if (!_client.subscribe(filter)) {
    error = _client.lastError();
    if (error.ok()) {
      error = Error(ErrorCode::TRANSPORT, "subscribe " + filter + " failed");
    }
    return false;
  }
  _filters.push_back(filter);
  return true;
}

void SessionBinding::release() {
  if (!_attached) {
    return;
  }
  for (size_t i = 0; i < _filters.size(); ++i) {
    if (!_client.unsubscribe(_filters[i])) {
      spdlog::warn("Could not unsubscribe {}: {}", _filters[i], _client.lastError().detail);
    }
  }
  _filters.clear();
  _client.setMessageHandler(transport::MessageHandler());
  _attached = false;
}

}  // namespace services
}  // namespace gridlink
