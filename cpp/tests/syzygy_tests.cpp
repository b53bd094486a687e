/**
 * Tablebase wrapper behaviour that does not need table files.
 */

#include <doctest/doctest.h>
#include <chess.hpp>

#include "../src/errors.hpp"
#include "../src/tablebase/syzygy.hpp"

using namespace kibitz;

TEST_SUITE("Syzygy tablebase") {

    TEST_CASE("Empty path disables probing") {
        SyzygyTablebase tablebase("");
        CHECK_FALSE(tablebase.enabled());
        CHECK(tablebase.max_pieces() == 0);

        chess::Board kk("8/8/4k3/8/8/3K4/8/8 w - - 0 1");
        CHECK_FALSE(tablebase.covers(kk));
        CHECK_THROWS_AS((void)tablebase.probe_wdl(kk), TablebaseError);
    }

    TEST_CASE("Directory without tables is an error") {
        CHECK_THROWS_AS(SyzygyTablebase("/nonexistent/kibitz-syzygy"), TablebaseError);
    }

    TEST_CASE("WDL values as shown to users") {
        CHECK(to_int(Wdl::LOSS) == -2);
        CHECK(to_int(Wdl::BLESSED_LOSS) == -1);
        CHECK(to_int(Wdl::DRAW) == 0);
        CHECK(to_int(Wdl::CURSED_WIN) == 1);
        CHECK(to_int(Wdl::WIN) == 2);
    }
}
