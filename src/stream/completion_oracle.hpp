#pragma once

#include <string>
#include <core/types.hpp>
#include <core/cancel_token.hpp>

class Plans;

// Answers "has this plan reached a terminal state?". Every call is a fresh
// remote read: status can change between calls while a reader is polling.
// Errors are returned unchanged so the caller decides what is fatal.
class CompletionOracle {
public:
    virtual ~CompletionOracle() = default;

    virtual Result<bool> is_done() = 0;
};

// Oracle bound to one plan ID. plans must outlive the oracle.
class PlanCompletionOracle : public CompletionOracle {
public:
    PlanCompletionOracle(Plans& plans, std::string plan_id, CancelToken cancel);

    Result<bool> is_done() override;

    const std::string& plan_id() const { return plan_id_; }

private:
    Plans& plans_;
    std::string plan_id_;
    CancelToken cancel_;
};
