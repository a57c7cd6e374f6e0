#define BOOST_TEST_MODULE raffle_math_tests
#include <boost/test/unit_test.hpp>

#include <raffle/raffle.math.hpp>

#include <map>
#include <random>
#include <string>
#include <vector>

using namespace rafflefi;

namespace {

struct holder {
   std::string name;
   uint64_t    tickets;
};

uint64_t tickets_of(const holder& h) { return h.tickets; }

std::vector<holder>::const_iterator draw(const std::vector<holder>& holders, uint64_t roll) {
   return math::pick_weighted(holders.begin(), holders.end(), roll, tickets_of);
}

}

BOOST_AUTO_TEST_SUITE( bundle_pricing_tests )

BOOST_AUTO_TEST_CASE( bundles_from_ticket_price )
{
   math::bundle_terms_list bundles;
   BOOST_REQUIRE( math::make_bundles(5000, bundles) );

   BOOST_CHECK_EQUAL( bundles[math::SMALL].amount, 45u );
   BOOST_CHECK_EQUAL( bundles[math::SMALL].price, 5000 );
   BOOST_CHECK_EQUAL( bundles[math::MEDIUM].amount, 200u );
   BOOST_CHECK_EQUAL( bundles[math::MEDIUM].price, 15000 );
   BOOST_CHECK_EQUAL( bundles[math::LARGE].amount, 660u );
   BOOST_CHECK_EQUAL( bundles[math::LARGE].price, 25000 );

   for (uint8_t i = 1; i < math::BUNDLE_COUNT; i++) {
      BOOST_CHECK_GT( bundles[i].price, bundles[i - 1].price );
      // cheaper per ticket as the bundle grows
      BOOST_CHECK_LT( bundles[i].price * (int64_t)bundles[i - 1].amount,
                      bundles[i - 1].price * (int64_t)bundles[i].amount );
   }
}

BOOST_AUTO_TEST_CASE( invalid_ticket_price )
{
   math::bundle_terms_list bundles;
   BOOST_CHECK( !math::make_bundles(0, bundles) );
   BOOST_CHECK( !math::make_bundles(-1, bundles) );
   BOOST_CHECK( !math::make_bundles(std::numeric_limits<int64_t>::max() / 4, bundles) );
   BOOST_CHECK( math::make_bundles(std::numeric_limits<int64_t>::max() / 5, bundles) );
}

BOOST_AUTO_TEST_CASE( classify_fallback_payment )
{
   math::bundle_terms_list bundles;
   BOOST_REQUIRE( math::make_bundles(5000, bundles) );

   BOOST_CHECK_EQUAL( math::classify_payment(bundles, 4999), math::BUNDLE_COUNT );
   BOOST_CHECK_EQUAL( math::classify_payment(bundles, 0), math::BUNDLE_COUNT );
   BOOST_CHECK_EQUAL( math::classify_payment(bundles, 5000), math::SMALL );
   BOOST_CHECK_EQUAL( math::classify_payment(bundles, 14999), math::SMALL );
   BOOST_CHECK_EQUAL( math::classify_payment(bundles, 15000), math::MEDIUM );
   BOOST_CHECK_EQUAL( math::classify_payment(bundles, 24999), math::MEDIUM );
   BOOST_CHECK_EQUAL( math::classify_payment(bundles, 25000), math::LARGE );
   BOOST_CHECK_EQUAL( math::classify_payment(bundles, 1000000), math::LARGE );
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE( pot_split_tests )

BOOST_AUTO_TEST_CASE( half_pot_prize )
{
   auto split = math::split_pot(15000, 0);
   BOOST_CHECK_EQUAL( split.prize, 7500 );
   BOOST_CHECK_EQUAL( split.donation, 5625 );
   BOOST_CHECK_EQUAL( split.commission, 1875 );

   split = math::split_pot(25000, 0);
   BOOST_CHECK_EQUAL( split.prize, 12500 );
   BOOST_CHECK_EQUAL( split.donation, 9375 );
   BOOST_CHECK_EQUAL( split.commission, 3125 );
}

BOOST_AUTO_TEST_CASE( fixed_prize_paid_in_full )
{
   auto split = math::split_pot(15000000, 3000000);
   BOOST_CHECK_EQUAL( split.prize, 3000000 );
   BOOST_CHECK_EQUAL( split.donation, 9000000 );
   BOOST_CHECK_EQUAL( split.commission, 3000000 );

   // pot between the fixed prize and twice of it still pays the whole prize
   split = math::split_pot(5000000, 3000000);
   BOOST_CHECK_EQUAL( split.prize, 3000000 );
   BOOST_CHECK_EQUAL( split.donation, 1500000 );
   BOOST_CHECK_EQUAL( split.commission, 500000 );

   split = math::split_pot(4000000, 3000000);
   BOOST_CHECK_EQUAL( split.prize, 3000000 );
   BOOST_CHECK_EQUAL( split.donation, 750000 );
   BOOST_CHECK_EQUAL( split.commission, 250000 );

   // until the pot exceeds the fixed prize it pays half of the pot
   split = math::split_pot(3000000, 3000000);
   BOOST_CHECK_EQUAL( split.prize, 1500000 );
   BOOST_CHECK_EQUAL( split.donation, 1125000 );
   BOOST_CHECK_EQUAL( split.commission, 375000 );

   BOOST_CHECK_EQUAL( math::prize_of(3000001, 3000000), 3000000 );
   BOOST_CHECK_EQUAL( math::prize_of(2000000, 3000000), 1000000 );
}

BOOST_AUTO_TEST_CASE( rounding_lands_on_commission )
{
   auto split = math::split_pot(1, 0);
   BOOST_CHECK_EQUAL( split.prize, 0 );
   BOOST_CHECK_EQUAL( split.donation, 0 );
   BOOST_CHECK_EQUAL( split.commission, 1 );

   split = math::split_pot(7, 0);
   BOOST_CHECK_EQUAL( split.prize, 3 );
   BOOST_CHECK_EQUAL( split.donation, 3 );
   BOOST_CHECK_EQUAL( split.commission, 1 );

   BOOST_CHECK_EQUAL( math::split_pot(0, 0).commission, 0 );
}

BOOST_AUTO_TEST_CASE( split_conserves_pot )
{
   const int64_t fixed_prizes[] = { 0, 1, 333, 3000000 };
   for (auto fixed : fixed_prizes) {
      for (int64_t pot = 1; pot < 20000; pot += 37) {
         auto split = math::split_pot(pot, fixed);
         BOOST_CHECK_EQUAL( split.prize + split.donation + split.commission, pot );
         BOOST_CHECK_EQUAL( split.prize, fixed > 0 && pot > fixed ? fixed : pot / 2 );
         BOOST_CHECK_GE( split.donation, 0 );
         BOOST_CHECK_GE( split.commission, split.donation / 3 );
      }
   }

   auto big = std::numeric_limits<int64_t>::max();
   auto split = math::split_pot(big, 0);
   BOOST_CHECK_EQUAL( split.prize + split.donation + split.commission, big );
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE( weighted_selection_tests )

BOOST_AUTO_TEST_CASE( each_holder_owns_a_block_of_slots )
{
   std::vector<holder> holders = { {"alice", 3}, {"bob", 1}, {"carol", 0}, {"dave", 2} };

   std::map<std::string, uint64_t> wins;
   for (uint64_t roll = 0; roll < 6; roll++) {
      auto itr = draw(holders, roll);
      BOOST_REQUIRE( itr != holders.end() );
      wins[itr->name]++;
   }
   BOOST_CHECK_EQUAL( wins["alice"], 3u );
   BOOST_CHECK_EQUAL( wins["bob"], 1u );
   BOOST_CHECK_EQUAL( wins.count("carol"), 0u );
   BOOST_CHECK_EQUAL( wins["dave"], 2u );

   BOOST_CHECK_EQUAL( draw(holders, 2)->name, "alice" );
   BOOST_CHECK_EQUAL( draw(holders, 3)->name, "bob" );
   BOOST_CHECK_EQUAL( draw(holders, 4)->name, "dave" );
}

BOOST_AUTO_TEST_CASE( roll_past_total_exhausts_scan )
{
   std::vector<holder> holders = { {"alice", 3}, {"bob", 1} };
   BOOST_CHECK( draw(holders, 4) == holders.end() );

   std::vector<holder> nobody;
   BOOST_CHECK( draw(nobody, 0) == nobody.end() );

   BOOST_CHECK_EQUAL( math::roll_of(17, 0), 0u );
   BOOST_CHECK_EQUAL( math::roll_of(17, 5), 2u );
}

BOOST_AUTO_TEST_CASE( heavier_holder_wins_more_often )
{
   std::vector<holder> holders = { {"alice", 200}, {"bob", 600}, {"carol", 200} };
   uint64_t total = 1000;

   std::mt19937_64 rng(20240917);
   std::map<std::string, uint64_t> wins;
   for (int raffle = 0; raffle < 500; raffle++) {
      auto itr = draw(holders, math::roll_of(rng(), total));
      BOOST_REQUIRE( itr != holders.end() );
      wins[itr->name]++;
   }

   BOOST_CHECK_GT( wins["bob"], wins["alice"] );
   BOOST_CHECK_GT( wins["bob"], wins["carol"] );
   BOOST_CHECK_EQUAL( wins["alice"] + wins["bob"] + wins["carol"], 500u );
}

BOOST_AUTO_TEST_CASE( digest_prefix_is_big_endian )
{
   std::array<uint8_t, 32> digest{};
   digest[0] = 0x01;
   digest[7] = 0xff;
   digest[8] = 0xaa;
   BOOST_CHECK_EQUAL( math::digest_to_uint64(digest), 0x01000000000000ffull );
}

BOOST_AUTO_TEST_SUITE_END()
