/*
 * 설명: 세션 레코드에서 비밀값을 제외한 요약을 만든다.
 * 버전: v1.0.0
 */
#include "jts/session.hpp"

namespace jts {

SessionSummary Summarize(const Session& session) {
  SessionSummary summary;
  summary.session_id = session.session_id;
  summary.principal = session.principal;
  summary.version = session.version;
  summary.created_at = session.created_at;
  summary.last_active_at = session.last_active_at;
  summary.expires_at = session.expires_at;
  summary.rotated_at = session.rotated_at;
  summary.device_fingerprint = session.device_fingerprint;
  summary.user_agent = session.user_agent;
  summary.ip_address = session.ip_address;
  summary.metadata = session.metadata;
  return summary;
}

}  // namespace jts
