#include "session_fsm.h"

#include "transfer/chunk_buffer.h"

namespace gridlink {
namespace fsm {

const char* toString(StateId id) {
  switch (id) {
    case STATE_IDLE:         return "Idle";
    case STATE_REQUESTED:    return "Requested";
    case STATE_TRANSFERRING: return "Transferring";
    case STATE_SUCCEEDED:    return "Succeeded";
    case STATE_FAILED:       return "Failed";
    case STATE_TIMED_OUT:    return "TimedOut";
    case STATE_ABORTED:      return "Aborted";
    default:                 break;
  }
  return "Unknown";
}

// ============================================================================
// Transfer-driven transitions, shared by Idle, Requested and Transferring
// ============================================================================
namespace {

etl::fsm_state_id_t afterTransferEvent(const SessionFsm& ctx) {
  return ctx.readyToSucceed() ? etl::fsm_state_id_t(STATE_SUCCEEDED)
                              : etl::fsm_state_id_t(STATE_TRANSFERRING);
}

}  // namespace

etl::fsm_state_id_t StateIdle::on_event(const EvTransferActivity&) {
  return afterTransferEvent(get_fsm_context());
}

etl::fsm_state_id_t StateIdle::on_event(const EvCompleteSignal&) {
  return afterTransferEvent(get_fsm_context());
}

etl::fsm_state_id_t StateRequested::on_event(const EvTransferActivity&) {
  return afterTransferEvent(get_fsm_context());
}

etl::fsm_state_id_t StateRequested::on_event(const EvCompleteSignal&) {
  return afterTransferEvent(get_fsm_context());
}

etl::fsm_state_id_t StateTransferring::on_event(const EvTransferActivity&) {
  return get_fsm_context().readyToSucceed() ? etl::fsm_state_id_t(STATE_SUCCEEDED)
                                            : etl::fsm_state_id_t(No_State_Change);
}

etl::fsm_state_id_t StateTransferring::on_event(const EvCompleteSignal&) {
  return get_fsm_context().readyToSucceed() ? etl::fsm_state_id_t(STATE_SUCCEEDED)
                                            : etl::fsm_state_id_t(No_State_Change);
}

// ============================================================================
// SessionFsm
// ============================================================================
SessionFsm::SessionFsm()
  : etl::fsm(FSM_ID)
  , _state_list{}
  , _buffer(nullptr)
  , _complete_seen(false)
{
}

void SessionFsm::begin(const transfer::ChunkBuffer* buffer) {
  _buffer = buffer;
  _complete_seen = false;

  _state_list[STATE_IDLE] = &_state_idle;
  _state_list[STATE_REQUESTED] = &_state_requested;
  _state_list[STATE_TRANSFERRING] = &_state_transferring;
  _state_list[STATE_SUCCEEDED] = &_state_succeeded;
  _state_list[STATE_FAILED] = &_state_failed;
  _state_list[STATE_TIMED_OUT] = &_state_timed_out;
  _state_list[STATE_ABORTED] = &_state_aborted;

  set_states(_state_list, NUMBER_OF_STATES);
  start();
}

bool SessionFsm::readyToSucceed() const {
  return _complete_seen && _buffer != nullptr && _buffer->isComplete();
}

void SessionFsm::completeSignal() {
  if (!isTerminal()) {
    _complete_seen = true;
  }
  receive(EvCompleteSignal());
}

}  // namespace fsm
}  // namespace gridlink
