#pragma once

#include <eosio/crypto.hpp>
#include <eosio/system.hpp>
#include <eosio/transaction.hpp>

#include <raffle/raffle.math.hpp>

namespace rafflefi {

using namespace eosio;

//ledger counters mixed into the draw
struct entropy_seed {
    uint64_t        sold_tickets    = 0;
    uint64_t        player_count    = 0;
    int64_t         pot             = 0;
};

class entropy_source {
   public:
      virtual ~entropy_source() {}

      virtual uint64_t next_random(const entropy_seed& seed) = 0;
};

/**
 * Hashes the TaPoS reference block, the block time and the seed.
 *
 * All inputs are visible to whoever signs the settling transaction and the
 * block producer can influence them, so the draw must be triggered by the
 * owner by hand rather than by an automated schedule. Swap in a verifiable
 * randomness source through `entropy_source` where that is not acceptable.
 */
class block_entropy: public entropy_source {
   public:
      uint64_t next_random(const entropy_seed& seed) override {
         _nonce++;
         uint64_t mixed[] = {
            uint64_t(tapos_block_num()),
            uint64_t(tapos_block_prefix()),
            uint64_t(current_time_point().time_since_epoch().count()),
            seed.sold_tickets,
            seed.player_count,
            uint64_t(seed.pot),
            _nonce
         };
         auto digest = sha256(reinterpret_cast<const char*>(mixed), sizeof(mixed));
         return math::digest_to_uint64(digest.extract_as_byte_array());
      }

   private:
      uint64_t _nonce = 0;
};

} //namespace rafflefi
