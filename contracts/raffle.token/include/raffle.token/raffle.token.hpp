#pragma once

#include <eosio/asset.hpp>
#include <eosio/eosio.hpp>
#include <eosio/singleton.hpp>
#include <string>

#define TRANSFER(bank, to, quantity, memo) \
    {	raffle_token::xtoken::transfer_action act{ bank, { {_self, raffle_token::active_perm} } };\
            act.send( _self, to, quantity , memo );}

namespace raffle_token
{

    using std::string;
    using namespace eosio;

    static constexpr eosio::name active_perm    {"active"_n};

    /**
     * The `raffle.token` contract is the currency used to price raffle tickets.
     *
     * It holds a single token whose supply is managed by one issuer. Balances live in the `accounts`
     * table scoped by owner and keyed by symbol code, the same layout as `eosio.token`, so any
     * `eosio.token` compatible contract can be configured as raffle currency instead.
     */
    class [[eosio::contract( "raffle.token" )]] xtoken : public contract
    {
    public:
        using contract::contract;

        xtoken(eosio::name receiver, eosio::name code, datastream<const char*> ds):
            contract(receiver, code, ds), _global(_self, _self.value)
        {
            if (_global.exists()) {
                _g = _global.get();

            } else { // first init
                _g = global_t{};
            }
        }

        ~xtoken() { _global.set( _g, get_self() ); }

        /**
         * Sets the issuer and the maximum supply. Can only be done once.
         *
         * @param issuer - the account allowed to issue and pause,
         * @param max_supply - the maximum supply, its symbol is the token symbol.
         */
        ACTION init(const name& issuer, const asset& max_supply);

        /**
         *  This action issues to `to` account a `quantity` of tokens.
         *
         * @param to - the account to issue tokens to,
         * @param quntity - the amount of tokens to be issued,
         * @memo - the memo string that accompanies the token issue transaction.
         */
        ACTION issue(const name &to, const asset &quantity, const string &memo);

        /**
         * Allows `from` account to transfer to `to` account the `quantity` tokens.
         * One account is debited and the other is credited with quantity tokens.
         *
         * @param from - the account to transfer from,
         * @param to - the account to be transferred to,
         * @param quantity - the quantity of tokens to be transferred,
         * @param memo - the memo string to accompany the transaction.
         */
        ACTION transfer(const name &from,
                        const name &to,
                        const asset &quantity,
                        const string &memo);

        /**
         * Pause token
         * If token is paused, users can not transfer
         * @param paused - is paused.
         */
        ACTION pause(const bool& paused) {
            require_auth( _g.issuer );
            _g.paused = paused;
        }

        static asset get_balance(const name &token_contract_account, const name &owner, const symbol_code &sym_code)
        {
            accounts accountstable(token_contract_account, owner.value);
            const auto &ac = accountstable.get(sym_code.raw(), "no balance object found");
            return ac.balance;
        }

        using transfer_action = eosio::action_wrapper<"transfer"_n, &xtoken::transfer>;

    private:
        struct [[eosio::table("global"), eosio::contract( "raffle.token" )]] global_t {
            asset supply;
            asset max_supply;
            name issuer;
            bool paused = false;

            EOSLIB_SERIALIZE( global_t, (supply)(max_supply)(issuer)(paused) )
        };

        typedef eosio::singleton< "global"_n, global_t > global_singleton;

        global_singleton    _global;
        global_t            _g;

        struct [[eosio::table]] account
        {
            asset balance;

            uint64_t primary_key() const { return balance.symbol.code().raw(); }

            EOSLIB_SERIALIZE( account, (balance) )
        };
        typedef eosio::multi_index<"accounts"_n, account> accounts;

    private:
        void _debit(const name& owner, const asset& quant);
        void _credit(const name& owner, const asset& quant, const name& ram_payer);
    };

}
