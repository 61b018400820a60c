/*
 * This file is part of GridLink host tools.
 * (C) 2025 Ignacio Santolin
 */
#ifndef GRIDLINK_SESSION_BINDING_H
#define GRIDLINK_SESSION_BINDING_H

#include <string>
#include <vector>

#include "gridlink_error.h"
#include "session/session.h"
#include "transport/transport.h"

namespace gridlink {
namespace services {

/**
 * Routes a transport's inbound messages into one Session for the lifetime
 * of an operation.
 *
 * attach() installs Session::post as the transport's message handler and
 * subscribes the given filters. release() (also run by the destructor)
 * unsubscribes them and clears the handler, so nothing is delivered to a
 * session that has gone out of scope.
 */
class SessionBinding {
 public:
  SessionBinding(transport::ITransport& client, session::Session& session);
  ~SessionBinding();

  bool attach(const std::vector<std::string>& filters, Error& error);

  // Adds one more filter to an attached binding.
  bool add(const std::string& filter, Error& error);

  void release();

  bool isAttached() const { return _attached; }

 private:
  SessionBinding(const SessionBinding&);
  SessionBinding& operator=(const SessionBinding&);

  transport::ITransport& _client;
  session::Session& _session;
  std::vector<std::string> _filters;
  bool _attached;
};

}  // namespace services
}  // namespace gridlink

#endif  // GRIDLINK_SESSION_BINDING_H
