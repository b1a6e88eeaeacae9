#include <tokens/lib/logging.hpp>
#include <tokens/secure/ledger.hpp>

#include <benchmark/benchmark.h>

static void BM_ledger_balance_existing (benchmark::State & state)
{
	tokens::account const creator{ "alice" };
	tokens::ledger ledger{ creator, 1000000 };

	for (auto _ : state)
	{
		benchmark::DoNotOptimize (ledger.balance (creator));
	}
}
BENCHMARK (BM_ledger_balance_existing);

static void BM_ledger_balance_missing (benchmark::State & state)
{
	tokens::ledger ledger{ tokens::account{ "alice" }, 1000000 };
	tokens::account const unknown{ "unknown" };

	for (auto _ : state)
	{
		benchmark::DoNotOptimize (ledger.balance (unknown));
	}
}
BENCHMARK (BM_ledger_balance_missing);

// Each iteration transfers out of a freshly created ledger, construction is excluded from the timing
static void BM_ledger_transfer (benchmark::State & state)
{
	tokens::account const creator{ "alice" };
	tokens::account const recipient{ "bob" };
	auto const supply = static_cast<tokens::amount> (state.range (0));
	auto const amount = static_cast<tokens::amount> (state.range (1));

	for (auto _ : state)
	{
		state.PauseTiming ();
		tokens::ledger ledger{ creator, supply };
		state.ResumeTiming ();

		auto result = ledger.transfer (creator, recipient, amount);
		benchmark::DoNotOptimize (result);
	}
}
// Success, then insufficient balance
BENCHMARK (BM_ledger_transfer)->ArgNames ({ "supply", "amount" })->Args ({ 1000000, 100 })->Args ({ 100, 200 });

int main (int argc, char ** argv)
{
	tokens::logger::initialize_dummy ();
	benchmark::Initialize (&argc, argv);
	if (benchmark::ReportUnrecognizedArguments (argc, argv))
	{
		return 1;
	}
	benchmark::RunSpecifiedBenchmarks ();
	benchmark::Shutdown ();
	return 0;
}
