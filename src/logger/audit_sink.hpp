#pragma once

// ---------------------------------------------------------------------------
// audit_sink.hpp
//
// 엔진이 판정/리로드 기록을 내보내는 출력 인터페이스.
// 운영 구현은 StructuredLogger, 테스트는 메모리 기록용 구현을 주입한다.
//
// [호출 규약]
// - log_decision() 은 엔진 읽기 락을 보유한 여러 스레드에서 동시에 호출된다.
//   구현체는 스레드 안전해야 하며, 예외를 던지지 않아야 한다.
// - log_reload() 는 쓰기 락 아래에서 호출된다. 오래 블로킹하지 말 것
//   (그동안 모든 reader 가 대기한다).
// ---------------------------------------------------------------------------

#include "log_types.hpp"

class AuditSink {
public:
    virtual ~AuditSink() = default;

    virtual void log_decision(const DecisionLog& entry) = 0;
    virtual void log_reload(const ReloadLog& entry)     = 0;
};
