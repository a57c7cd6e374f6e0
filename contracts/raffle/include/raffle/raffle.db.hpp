#pragma once

#include <eosio/asset.hpp>
#include <eosio/eosio.hpp>
#include <eosio/singleton.hpp>
#include <eosio/system.hpp>
#include <eosio/time.hpp>

#include <raffle/raffle.math.hpp>

#include <memory>
#include <string>
#include <vector>

namespace rafflefi {

using namespace std;
using namespace eosio;

static constexpr uint64_t  DAY_SECONDS       = 24 * 60 * 60;

static constexpr name      SMALL_TIER        = "small"_n;
static constexpr name      MEDIUM_TIER       = "medium"_n;
static constexpr name      LARGE_TIER        = "large"_n;

static constexpr std::array<name, math::BUNDLE_COUNT> BUNDLE_TIERS = { SMALL_TIER, MEDIUM_TIER, LARGE_TIER };

//index into BUNDLE_TIERS, math::BUNDLE_COUNT for an unknown tier
inline uint8_t tier_index(const name& tier) {
    for (uint8_t i = 0; i < math::BUNDLE_COUNT; i++) {
        if (BUNDLE_TIERS[i] == tier) return i;
    }
    return math::BUNDLE_COUNT;
}

#define TBL struct [[eosio::table, eosio::contract("raffle")]]
#define NTBL(name) struct [[eosio::table(name), eosio::contract("raffle")]]

struct bundle_t {
    name                tier;
    uint64_t            amount      = 0;                //tickets granted
    asset               price;

    EOSLIB_SERIALIZE( bundle_t, (tier)(amount)(price) )
};

struct distribution_t {
    asset               prize;
    asset               donation;
    asset               commission;

    EOSLIB_SERIALIZE( distribution_t, (prize)(donation)(commission) )
};

//written once by finish()
struct settlement_t {
    distribution_t      payout;
    name                donation_account;
    time_point_sec      settled_at;

    EOSLIB_SERIALIZE( settlement_t, (payout)(donation_account)(settled_at) )
};

NTBL("global") global_t {
    name                owner;                                  //settles the raffle, never plays
    extended_symbol     currency;
    asset               ticket_price;
    vector<bundle_t>    bundles;                                //small, medium, large
    time_point_sec      started_at;
    time_point_sec      raffle_end_date;
    asset               fixed_prize;                            //0 for half of the pot
    name                donation_account;                       //default receiver of the donation share

    asset               pot;                                    //collected - distributed
    asset               collected;
    asset               distributed;
    asset               credits;                                //unspent deposits, never part of the pot
    uint64_t            sold_tickets            = 0;
    uint64_t            player_count            = 0;
    uint64_t            last_player_seq         = 0;

    name                winner;                                 //empty until settled
    settlement_t        settlement;

    EOSLIB_SERIALIZE( global_t, (owner)(currency)(ticket_price)(bundles)(started_at)(raffle_end_date)
                                (fixed_prize)(donation_account)
                                (pot)(collected)(distributed)(credits)
                                (sold_tickets)(player_count)(last_player_seq)
                                (winner)(settlement) )
};
typedef eosio::singleton< "global"_n, global_t > global_singleton;

struct global_state: public global_t {
    public:
        bool changed = false;

        using ptr_t = std::unique_ptr<global_state>;

        static ptr_t make_global(const name &contract) {
            auto ret = std::make_unique<global_state>();
            ret->_global_tbl = std::make_unique<global_singleton>(contract, contract.value);

            if (ret->_global_tbl->exists()) {
                static_cast<global_t&>(*ret) = ret->_global_tbl->get();
            }
            return ret;
        }

        inline bool initialized() const {
            return owner != name();
        }

        inline bool settled() const {
            return winner != name();
        }

        inline uint64_t new_player_seq() {
            last_player_seq++;
            change();
            return last_player_seq;
        }

        inline void change() {
            changed = true;
        }

        inline void save(const name &payer) {
            if (changed) {
                auto &g = static_cast<global_t&>(*this);
                _global_tbl->set(g, payer);
                changed = false;
            }
        }
    private:
        std::unique_ptr<global_singleton> _global_tbl;
};

//Scope: _self
TBL player_t {
    name                account;                                //PK
    uint64_t            seq             = 0;                    //insertion order, drives the winner scan
    uint64_t            tickets         = 0;
    uint64_t            referrals       = 0;                    //bonus tickets received as a referral
    bool                free_claimed    = false;
    time_point_sec      joined_at;

    player_t() {}
    player_t(const name& a): account(a) {}
    uint64_t primary_key() const { return account.value; }
    uint64_t by_seq() const { return seq; }

    typedef eosio::multi_index< "players"_n, player_t,
        indexed_by< "byseq"_n, const_mem_fun<player_t, uint64_t, &player_t::by_seq> >
    > tbl_t;

    EOSLIB_SERIALIZE( player_t, (account)(seq)(tickets)(referrals)(free_claimed)(joined_at) )
};

//Scope: _self
//Note: record is deleted when the credit is spent or refunded
TBL credit_t {
    name                owner;                                  //PK
    asset               balance;
    time_point_sec      updated_at;

    credit_t() {}
    credit_t(const name& o): owner(o) {}
    uint64_t primary_key() const { return owner.value; }

    typedef eosio::multi_index< "credits"_n, credit_t > tbl_t;

    EOSLIB_SERIALIZE( credit_t, (owner)(balance)(updated_at) )
};

} //namespace rafflefi
