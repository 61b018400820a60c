/**
 * @file session_fsm.h
 * @brief ETL-based Finite State Machine for one GridLink operation
 *
 * Every operation (core dump request, passive capture, firmware push) is
 * driven by one instance. All transitions are explicit and terminal states
 * are sticky: once a verdict is reached no event changes it.
 *
 * States:
 *   - Idle (0): Session created, nothing published yet.
 *   - Requested (1): Command published, waiting for the device.
 *   - Transferring (2): First header/chunk/complete for the target seen.
 *   - Succeeded (3): Terminal. Complete signal seen and buffer complete,
 *                    or vacuous success, or device-announced success.
 *   - Failed (4): Terminal. Device reported a matching error.
 *   - TimedOut (5): Terminal. Deadline passed before any verdict.
 *   - Aborted (6): Terminal. Caller cancelled the operation.
 *
 * Events:
 *   - EvCommandPublished: Idle → Requested
 *   - EvTransferActivity: header or chunk accepted → Transferring
 *                         (→ Succeeded when the completion rule holds)
 *   - EvCompleteSignal: Complete event → Succeeded if buffer complete
 *   - EvNothingToTransfer: "nothing to transfer" status → Succeeded
 *   - EvOperationSucceeded: success status → Succeeded
 *   - EvDeviceFailure: matching error text → Failed
 *   - EvDeadlineExpired: watchdog → TimedOut
 *   - EvAbort: caller → Aborted
 */
#ifndef GRIDLINK_SESSION_FSM_H
#define GRIDLINK_SESSION_FSM_H

#include "etl/fsm.h"
#include "etl/message.h"

namespace gridlink {

namespace transfer {
class ChunkBuffer;
}

namespace fsm {

// Forward declaration
class SessionFsm;

// ============================================================================
// State IDs - Must be sequential starting from 0
// ============================================================================
enum StateId : etl::fsm_state_id_t {
  STATE_IDLE = 0,
  STATE_REQUESTED = 1,
  STATE_TRANSFERRING = 2,
  STATE_SUCCEEDED = 3,
  STATE_FAILED = 4,
  STATE_TIMED_OUT = 5,
  STATE_ABORTED = 6,
  NUMBER_OF_STATES = 7
};

const char* toString(StateId id);

// ============================================================================
// Event IDs - Unique message identifiers
// ============================================================================
enum EventId : etl::message_id_t {
  EVENT_COMMAND_PUBLISHED = 0,
  EVENT_TRANSFER_ACTIVITY = 1,
  EVENT_COMPLETE_SIGNAL = 2,
  EVENT_NOTHING_TO_TRANSFER = 3,
  EVENT_OPERATION_SUCCEEDED = 4,
  EVENT_DEVICE_FAILURE = 5,
  EVENT_DEADLINE_EXPIRED = 6,
  EVENT_ABORT = 7
};

// ============================================================================
// Event Messages
// ============================================================================
struct EvCommandPublished : public etl::message<EVENT_COMMAND_PUBLISHED> {};
struct EvTransferActivity : public etl::message<EVENT_TRANSFER_ACTIVITY> {};
struct EvCompleteSignal : public etl::message<EVENT_COMPLETE_SIGNAL> {};
struct EvNothingToTransfer : public etl::message<EVENT_NOTHING_TO_TRANSFER> {};
struct EvOperationSucceeded : public etl::message<EVENT_OPERATION_SUCCEEDED> {};
struct EvDeviceFailure : public etl::message<EVENT_DEVICE_FAILURE> {};
struct EvDeadlineExpired : public etl::message<EVENT_DEADLINE_EXPIRED> {};
struct EvAbort : public etl::message<EVENT_ABORT> {};

// ============================================================================
// State: Idle (Initial State)
// ============================================================================
class StateIdle : public etl::fsm_state<SessionFsm, StateIdle, STATE_IDLE,
                                         EvCommandPublished, EvTransferActivity, EvCompleteSignal,
                                         EvNothingToTransfer, EvOperationSucceeded,
                                         EvDeviceFailure, EvDeadlineExpired, EvAbort>
{
public:
  etl::fsm_state_id_t on_enter_state() {
    return STATE_IDLE;
  }

  etl::fsm_state_id_t on_event(const EvCommandPublished&) {
    return STATE_REQUESTED;
  }

  // Passive capture never publishes: the first chunk starts the transfer.
  etl::fsm_state_id_t on_event(const EvTransferActivity&);
  etl::fsm_state_id_t on_event(const EvCompleteSignal&);

  etl::fsm_state_id_t on_event(const EvNothingToTransfer&) {
    return STATE_SUCCEEDED;
  }

  etl::fsm_state_id_t on_event(const EvOperationSucceeded&) {
    return STATE_SUCCEEDED;
  }

  etl::fsm_state_id_t on_event(const EvDeviceFailure&) {
    return STATE_FAILED;
  }

  etl::fsm_state_id_t on_event(const EvDeadlineExpired&) {
    return STATE_TIMED_OUT;
  }

  etl::fsm_state_id_t on_event(const EvAbort&) {
    return STATE_ABORTED;
  }

  etl::fsm_state_id_t on_event_unknown(const etl::imessage&) {
    return No_State_Change;
  }
};

// ============================================================================
// State: Requested
// ============================================================================
class StateRequested : public etl::fsm_state<SessionFsm, StateRequested, STATE_REQUESTED,
                                              EvCommandPublished, EvTransferActivity, EvCompleteSignal,
                                              EvNothingToTransfer, EvOperationSucceeded,
                                              EvDeviceFailure, EvDeadlineExpired, EvAbort>
{
public:
  etl::fsm_state_id_t on_enter_state() {
    return STATE_REQUESTED;
  }

  etl::fsm_state_id_t on_event(const EvCommandPublished&) {
    return No_State_Change;  // Broadcast mode publishes once per device
  }

  etl::fsm_state_id_t on_event(const EvTransferActivity&);
  etl::fsm_state_id_t on_event(const EvCompleteSignal&);

  etl::fsm_state_id_t on_event(const EvNothingToTransfer&) {
    return STATE_SUCCEEDED;
  }

  etl::fsm_state_id_t on_event(const EvOperationSucceeded&) {
    return STATE_SUCCEEDED;
  }

  etl::fsm_state_id_t on_event(const EvDeviceFailure&) {
    return STATE_FAILED;
  }

  etl::fsm_state_id_t on_event(const EvDeadlineExpired&) {
    return STATE_TIMED_OUT;
  }

  etl::fsm_state_id_t on_event(const EvAbort&) {
    return STATE_ABORTED;
  }

  etl::fsm_state_id_t on_event_unknown(const etl::imessage&) {
    return No_State_Change;
  }
};

// ============================================================================
// State: Transferring
// ============================================================================
class StateTransferring : public etl::fsm_state<SessionFsm, StateTransferring, STATE_TRANSFERRING,
                                                 EvTransferActivity, EvCompleteSignal,
                                                 EvNothingToTransfer, EvOperationSucceeded,
                                                 EvDeviceFailure, EvDeadlineExpired, EvAbort>
{
public:
  etl::fsm_state_id_t on_enter_state() {
    return STATE_TRANSFERRING;
  }

  // Completion is re-checked on every chunk so Complete may arrive first.
  etl::fsm_state_id_t on_event(const EvTransferActivity&);
  etl::fsm_state_id_t on_event(const EvCompleteSignal&);

  etl::fsm_state_id_t on_event(const EvNothingToTransfer&) {
    return STATE_SUCCEEDED;
  }

  etl::fsm_state_id_t on_event(const EvOperationSucceeded&) {
    return STATE_SUCCEEDED;
  }

  etl::fsm_state_id_t on_event(const EvDeviceFailure&) {
    return STATE_FAILED;
  }

  etl::fsm_state_id_t on_event(const EvDeadlineExpired&) {
    return STATE_TIMED_OUT;
  }

  etl::fsm_state_id_t on_event(const EvAbort&) {
    return STATE_ABORTED;
  }

  etl::fsm_state_id_t on_event_unknown(const etl::imessage&) {
    return No_State_Change;
  }
};

// ============================================================================
// Terminal states - every event is ignored
// ============================================================================
template <typename TDerived, StateId ID>
class TerminalState : public etl::fsm_state<SessionFsm, TDerived, ID>
{
public:
  etl::fsm_state_id_t on_enter_state() {
    return ID;
  }

  etl::fsm_state_id_t on_event_unknown(const etl::imessage&) {
    return etl::ifsm_state::No_State_Change;
  }
};

class StateSucceeded : public TerminalState<StateSucceeded, STATE_SUCCEEDED> {};
class StateFailed : public TerminalState<StateFailed, STATE_FAILED> {};
class StateTimedOut : public TerminalState<StateTimedOut, STATE_TIMED_OUT> {};
class StateAborted : public TerminalState<StateAborted, STATE_ABORTED> {};

// ============================================================================
// FSM Class
// ============================================================================
class SessionFsm : public etl::fsm
{
public:
  SessionFsm();

  // Binds the transfer whose completeness gates success, then starts in Idle.
  void begin(const transfer::ChunkBuffer* buffer);

  // State Accessors
  StateId stateId() const { return static_cast<StateId>(get_state_id()); }
  bool isIdle() const { return get_state_id() == STATE_IDLE; }
  bool isRequested() const { return get_state_id() == STATE_REQUESTED; }
  bool isTransferring() const { return get_state_id() == STATE_TRANSFERRING; }
  bool isSucceeded() const { return get_state_id() == STATE_SUCCEEDED; }
  bool isFailed() const { return get_state_id() == STATE_FAILED; }
  bool isTimedOut() const { return get_state_id() == STATE_TIMED_OUT; }
  bool isAborted() const { return get_state_id() == STATE_ABORTED; }
  bool isTerminal() const { return get_state_id() >= STATE_SUCCEEDED; }

  bool completeSeen() const { return _complete_seen; }

  // Complete signal seen and every declared chunk present.
  bool readyToSucceed() const;

  // Event Triggers
  void commandPublished() { receive(EvCommandPublished()); }
  void transferActivity() { receive(EvTransferActivity()); }
  void completeSignal();
  void nothingToTransfer() { receive(EvNothingToTransfer()); }
  void operationSucceeded() { receive(EvOperationSucceeded()); }
  void deviceFailure() { receive(EvDeviceFailure()); }
  void deadlineExpired() { receive(EvDeadlineExpired()); }
  void abort() { receive(EvAbort()); }

private:
  static constexpr etl::message_router_id_t FSM_ID = 2;

  // Per instance: several sessions may be alive at once.
  StateIdle _state_idle;
  StateRequested _state_requested;
  StateTransferring _state_transferring;
  StateSucceeded _state_succeeded;
  StateFailed _state_failed;
  StateTimedOut _state_timed_out;
  StateAborted _state_aborted;
  etl::ifsm_state* _state_list[NUMBER_OF_STATES];

  const transfer::ChunkBuffer* _buffer;
  bool _complete_seen;
};

}  // namespace fsm
}  // namespace gridlink

#endif  // GRIDLINK_SESSION_FSM_H
