/*
 * This file is part of GridLink host tools.
 * (C) 2025 Ignacio Santolin
 */
#ifndef GRIDLINK_TRANSPORT_H
#define GRIDLINK_TRANSPORT_H

#include <string>

#include "etl/delegate.h"

#include "gridlink_error.h"

namespace gridlink {
namespace transport {

// Invoked on the transport's delivery thread for every inbound message.
typedef etl::delegate<void(const std::string& topic, const std::string& payload)> MessageHandler;

/**
 * Publish/subscribe client used by every operation.
 *
 * Failures are reported as false with lastError() set to TRANSPORT; an
 * operation that sees one gives up as a whole.
 */
class ITransport {
 public:
  virtual ~ITransport() {}

  virtual bool connect() = 0;
  virtual void disconnect() = 0;
  virtual bool isConnected() const = 0;

  virtual bool subscribe(const std::string& filter) = 0;
  virtual bool unsubscribe(const std::string& filter) = 0;
  virtual bool publish(const std::string& topic, const std::string& payload) = 0;

  // Replaces the inbound handler. An unset delegate drops messages.
  virtual void setMessageHandler(const MessageHandler& handler) = 0;

  virtual const Error& lastError() const = 0;
};

}  // namespace transport
}  // namespace gridlink

#endif  // GRIDLINK_TRANSPORT_H
