#pragma once

#include <eosio/asset.hpp>
#include <eosio/eosio.hpp>
#include <eosio/permission.hpp>
#include <eosio/action.hpp>

#include <string>

#include <raffle/raffle.db.hpp>
#include <raffle/raffle.entropy.hpp>
#include <raffle.utils.hpp>

#define REFERRED_NOTIFY(referral, referrer) \
    {   rafflefi::raffle::referred_action act{ _self, { {_self, active_perm} } };\
            act.send( referral, referrer ); }

#define WINNER_NOTIFY(winner, prize) \
    {   rafflefi::raffle::winnerpicked_action act{ _self, { {_self, active_perm} } };\
            act.send( winner, prize ); }

namespace rafflefi {

using std::string;
using std::vector;

using namespace eosio;

static constexpr eosio::name active_perm{"active"_n};

enum class err: uint8_t {
   NONE                    = 0,
   NOT_INITIALIZED         = 1,
   ALREADY_INITIALIZED     = 2,
   CONTRACT_MISMATCH       = 3,
   SYMBOL_MISMATCH         = 4,
   PARAM_ERROR             = 5,
   MEMO_FORMAT_ERROR       = 6,
   NO_AUTH                 = 7,
   OWNER_EXCLUDED          = 8,
   TIME_EXPIRED            = 9,
   TIME_PREMATURE          = 10,
   TIME_INVALID            = 11,
   INSUFFICIENT_FUNDS      = 12,
   INSUFFICIENT_ALLOWANCE  = 13,
   INVALID_PURCHASE        = 14,
   ALREADY_CLAIMED         = 15,
   ALREADY_SETTLED         = 16,
   EMPTY_POT               = 17,
   NO_PARTICIPANTS         = 18,
   SELF_REFERRAL           = 19,
   NOT_A_PLAYER            = 20,
   TRANSFER_FAILED         = 21,
   ACCOUNT_INVALID         = 22
};

/**
 * The `raffle` contract sells ticket bundles for one currency token and, after an immutable end date,
 * lets its owner draw one winner weighted by tickets held and split the pot between the winner, a
 * donation account and the owner.
 *
 * Tickets are bought by transferring the currency to the contract with a `bundle:<tier>[:<referral>]`
 * memo, with an empty memo (the largest affordable tier is picked), or by depositing credit with a
 * `deposit` memo and spending it through `buybundle`. Players live in the `players` table, ordered by
 * the sequence in which they joined; that order is the order of the weighted winner scan.
 */
class [[eosio::contract("raffle")]] raffle : public contract {
   public:
      using contract::contract;

   raffle(eosio::name receiver, eosio::name code, datastream<const char*> ds): contract(receiver, code, ds),
        _gstate(global_state::make_global(get_self()))
    {
    }

    ~raffle() { _gstate->save(get_self()); }

   /**
    * Opens the raffle. Derives the three bundles from `ticket_price` and fixes the end date to
    * `duration_days` days from now.
    *
    * @param owner - settles the raffle and receives the commission, can not play
    * @param ticket_price - price of the small bundle, its contract and symbol become the currency
    * @param duration_days - at least 1
    * @param fixed_prize - prize cap, zero to always pay half of the pot
    * @param donation - default receiver of the donation share
    */
   ACTION init(const name& owner, const extended_asset& ticket_price, const uint8_t& duration_days,
               const asset& fixed_prize, const name& donation);

   /**
    * @param memo:
    *       1) bundle:$tier[:$referral] - buy a bundle, tiers: small, medium, large
    *       2) empty                    - buy the largest bundle the payment covers
    *       3) deposit                  - credit the payment for buybundle
    */
   [[eosio::on_notify("*::transfer")]]
   void ontransfer(const name& from, const name& to, const asset& quant, const string& memo);

   //buys a bundle with deposited credit, referral may be empty
   [[eosio::action]] uint64_t buybundle(const name& player, const name& tier, const name& referral);

   ACTION refund(const name& player);

   ACTION freeticket(const name& player);

   /**
    * Draws the winner and pays out the pot.
    * @param donation - receiver of the donation share, empty for the one set at init
    * @return the winner
    */
   [[eosio::action]] name finish(const name& donation);

   //owner only
   [[eosio::action]] uint64_t soldtickets();

   [[eosio::action, eosio::read_only]] vector<bundle_t> getbundles();
   [[eosio::action, eosio::read_only]] bundle_t getbundle(const name& tier);
   [[eosio::action, eosio::read_only]] uint64_t tickets(const name& player);
   [[eosio::action, eosio::read_only]] asset pot();
   [[eosio::action, eosio::read_only]] asset prizepool();
   [[eosio::action, eosio::read_only]] asset donationamt();
   [[eosio::action, eosio::read_only]] distribution_t distribution();
   [[eosio::action, eosio::read_only]] name winner();
   [[eosio::action, eosio::read_only]] time_point_sec enddate();

   ACTION referred(const name& referral, const name& referrer) {
      require_auth( _self );
      require_recipient( referral );
   }

   ACTION winnerpicked(const name& winner, const asset& prize) {
      require_auth( _self );
      require_recipient( winner );
   }

   using referred_action      = eosio::action_wrapper<"referred"_n, &raffle::referred>;
   using winnerpicked_action  = eosio::action_wrapper<"winnerpicked"_n, &raffle::winnerpicked>;

   private:
      void _check_open();
      void _check_player(const name& player);
      bundle_t _get_bundle(const name& tier);
      void _check_referral(const name& player, const name& referral);

      uint64_t _record_purchase(const name& player, const bundle_t& bundle, const asset& paid, const name& referral);
      void _add_tickets(const name& player, const uint64_t& amount, const bool& free_ticket = false);
      void _grant_referral(const name& referral, const name& referrer);

      void _on_fallback(const name& from, const asset& quant);
      void _on_deposit(const name& from, const asset& quant);

      name _pick_winner(entropy_source& entropy);
      distribution_t _projected_distribution() const;
      void _transfer_out(const name& to, const asset& quant, const string& memo);

      global_state::ptr_t   _gstate;
};
} //namespace rafflefi
