#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

#include "consensus/refund_events.hpp"
#include "consensus/refund_ledger.hpp"
#include "tests/unit/util/merkle_builder.hpp"
#include "tests/unit/util/payout_fakes.hpp"

int main() {
  using namespace refundledger;
  using consensus::LedgerError;
  using consensus::LedgerEventType;
  using primitives::Amount;

  const auto alice = test::MakeAddress(0xA1);
  const auto bob = test::MakeAddress(0xB2);
  const auto funder = test::MakeAddress(0xF0);
  const test::MerkleBuilder tree({alice, bob});
  const auto root = tree.Root();
  const auto alice_proof = tree.Proof(0);

  // A payout that re-enters Refund for the same claim must not pay twice.
  {
    test::FakePayoutChannel payouts;
    consensus::RecordingEventSink events;
    consensus::RefundLedger ledger(&payouts, &events);
    if (!ledger.SetBatches(funder, {root}, {Amount(40)}, Amount(100)).ok) {
      std::cerr << "setbatches failed\n";
      return EXIT_FAILURE;
    }
    events.Clear();
    bool reentered = false;
    bool effects_visible = false;
    consensus::LedgerResult inner;
    payouts.hook = [&](const primitives::Address&, const Amount&) {
      if (!reentered) {
        reentered = true;
        effects_visible =
            ledger.IsRefunded(funder, alice) && ledger.BalanceOf(funder) == Amount(60);
        inner = ledger.Refund(alice, funder, alice_proof);
      }
      return true;
    };
    const auto outer = ledger.Refund(alice, funder, alice_proof);
    if (!outer.ok || inner.ok || inner.code != LedgerError::kNotRefundable) {
      std::cerr << "reentrant refund was not blocked\n";
      return EXIT_FAILURE;
    }
    if (!effects_visible) {
      std::cerr << "effects not visible to the reentrant call\n";
      return EXIT_FAILURE;
    }
    if (payouts.transfers.size() != 1 || ledger.BalanceOf(funder) != Amount(60)) {
      std::cerr << "reentrant refund paid twice\n";
      return EXIT_FAILURE;
    }
    if (events.Size() != 1 || events.Events()[0].type != LedgerEventType::kRefunded) {
      std::cerr << "unexpected events after blocked reentrancy\n";
      return EXIT_FAILURE;
    }
  }

  // A nested operation that moves no value commits with the outer operation
  // and its events are delivered in emission order. A nested payout is
  // refused and leaves nothing behind.
  {
    test::FakePayoutChannel payouts;
    consensus::RecordingEventSink events;
    consensus::RefundLedger ledger(&payouts, &events);
    if (!ledger.SetBatches(funder, {root}, {Amount(40)}, Amount(100)).ok) {
      std::cerr << "setbatches failed\n";
      return EXIT_FAILURE;
    }
    events.Clear();
    bool reentered = false;
    consensus::LedgerResult topped_up;
    consensus::LedgerResult drained;
    consensus::LedgerResult removed;
    std::size_t delivered_during_payout = 0;
    payouts.hook = [&](const primitives::Address& to, const Amount&) {
      if (!reentered && to == alice) {
        reentered = true;
        topped_up = ledger.IncreaseBalance(funder, Amount(5));
        drained = ledger.Withdraw(funder);
        removed = ledger.RemoveBatches(funder);
        delivered_during_payout = events.Size();
      }
      return true;
    };
    const auto outer = ledger.Refund(alice, funder, alice_proof);
    if (!outer.ok || !topped_up.ok) {
      std::cerr << "refund with nested top-up failed\n";
      return EXIT_FAILURE;
    }
    if (drained.ok || drained.code != LedgerError::kReentrantPayout || removed.ok ||
        removed.code != LedgerError::kReentrantPayout) {
      std::cerr << "nested payout was not refused\n";
      return EXIT_FAILURE;
    }
    if (delivered_during_payout != 0) {
      std::cerr << "nested events delivered before the outer commit\n";
      return EXIT_FAILURE;
    }
    if (events.Size() != 2 || events.Events()[0].type != LedgerEventType::kBalanceIncreased ||
        events.Events()[1].type != LedgerEventType::kRefunded) {
      std::cerr << "nested event order mismatch\n";
      return EXIT_FAILURE;
    }
    if (ledger.BalanceOf(funder) != Amount(65) || ledger.Roots(funder).size() != 1 ||
        payouts.transfers.size() != 1 || ledger.Depth() != 0) {
      std::cerr << "unexpected state after refused nested payout\n";
      return EXIT_FAILURE;
    }
  }

  // An outer failure reverts the committed effects of nested calls, and a
  // nested withdrawal can never pay out value the rollback then restores.
  {
    test::FakePayoutChannel payouts;
    consensus::RecordingEventSink events;
    consensus::RefundLedger ledger(&payouts, &events);
    const Amount funded(100);
    if (!ledger.SetBatches(funder, {root}, {Amount(40)}, funded).ok) {
      std::cerr << "setbatches failed\n";
      return EXIT_FAILURE;
    }
    events.Clear();
    bool reentered = false;
    consensus::LedgerResult topped_up;
    consensus::LedgerResult drained;
    consensus::LedgerResult partial;
    payouts.hook = [&](const primitives::Address& to, const Amount&) {
      if (to != alice) {
        return true;
      }
      if (!reentered) {
        reentered = true;
        topped_up = ledger.IncreaseBalance(funder, Amount(5));
        drained = ledger.Withdraw(funder);
        partial = ledger.WithdrawAmount(funder, Amount(10));
      }
      return false;
    };
    const auto outer = ledger.Refund(alice, funder, alice_proof);
    if (outer.ok || outer.code != LedgerError::kTransferFailed) {
      std::cerr << "outer refund should fail with TransferFailed\n";
      return EXIT_FAILURE;
    }
    if (!topped_up.ok || drained.code != LedgerError::kReentrantPayout ||
        partial.code != LedgerError::kReentrantPayout) {
      std::cerr << "unexpected nested outcomes\n";
      return EXIT_FAILURE;
    }
    if (ledger.BalanceOf(funder) != funded || ledger.IsRefunded(funder, alice)) {
      std::cerr << "outer failure did not revert nested effects\n";
      return EXIT_FAILURE;
    }
    Amount accounted;
    if (!primitives::CheckedAdd(payouts.TotalTo(funder), payouts.TotalTo(alice), &accounted) ||
        !primitives::CheckedAdd(accounted, ledger.BalanceOf(funder), &accounted) ||
        accounted != funded) {
      std::cerr << "value not conserved: paid plus balance is " << accounted.ToString() << "\n";
      return EXIT_FAILURE;
    }
    if (!payouts.transfers.empty() || events.Size() != 0) {
      std::cerr << "failed operation paid out or delivered events\n";
      return EXIT_FAILURE;
    }
  }

  // A payout channel that throws leaves the ledger untouched.
  {
    test::FakePayoutChannel payouts;
    consensus::RecordingEventSink events;
    consensus::RefundLedger ledger(&payouts, &events);
    if (!ledger.SetBatches(funder, {root}, {Amount(40)}, Amount(100)).ok) {
      std::cerr << "setbatches failed\n";
      return EXIT_FAILURE;
    }
    events.Clear();
    payouts.hook = [](const primitives::Address&, const Amount&) -> bool {
      throw std::runtime_error("channel exploded");
    };
    bool threw = false;
    try {
      (void)ledger.Refund(alice, funder, alice_proof);
    } catch (const std::runtime_error&) {
      threw = true;
    }
    if (!threw || ledger.Depth() != 0 || ledger.BalanceOf(funder) != Amount(100) ||
        ledger.IsRefunded(funder, alice) || events.Size() != 0) {
      std::cerr << "throwing payout left partial state\n";
      return EXIT_FAILURE;
    }
  }

  return EXIT_SUCCESS;
}
