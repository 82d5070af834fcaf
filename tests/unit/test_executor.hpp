#pragma once

namespace lendcore::tests {

void test_deposit_and_available();
void test_borrow_limit();
void test_withdraw_requires_zero_debt();
void test_repay_partial_and_over();
void test_zero_amounts();
void test_round_trip();
void test_unauthorized_caller();
void test_reentrant_borrow_sees_debt();
void test_reentrant_borrow_within_limit();
void test_transfer_failure_rolls_back();
void test_reentrant_effects_roll_back_with_outer();
void test_foreign_exception_rolls_back();
void test_journal_failure_halts();
void test_pull_mode_claim();
void test_amount_overflow();
void test_journal_savepoints();
void test_invariant_checker();

}  // namespace lendcore::tests
