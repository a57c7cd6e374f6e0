#include <raffle.token/raffle.token.hpp>
using namespace std;

namespace raffle_token {

void xtoken::init(const name& issuer, const asset& max_supply)
{
    require_auth( _self );
    check( _g.issuer == name(), "token already initialized" );
    check( is_account(issuer), "issuer account does not exist" );
    check( max_supply.symbol.is_valid(), "invalid symbol name" );
    check( max_supply.is_valid(), "invalid supply" );
    check( max_supply.amount > 0, "max-supply must be positive" );

    _g.issuer       = issuer;
    _g.max_supply   = max_supply;
    _g.supply       = asset(0, max_supply.symbol);
}

void xtoken::issue(const name &to, const asset &quantity, const string &memo)
{
    check( _g.issuer != name(), "token not initialized" );
    require_auth( _g.issuer );

    check( is_account(to), "to account does not exist" );
    check( memo.size() <= 256, "memo has more than 256 bytes" );
    check( quantity.is_valid(), "invalid quantity" );
    check( quantity.amount > 0, "must issue positive quantity" );
    check( quantity.symbol == _g.max_supply.symbol, "symbol precision mismatch" );
    check( quantity.amount <= _g.max_supply.amount - _g.supply.amount, "quantity exceeds available supply" );

    _g.supply += quantity;

    _credit( to, quantity, _g.issuer );
}

void xtoken::transfer(const name &from, const name &to, const asset &quantity, const string &memo)
{
    require_auth( from );

    check( from != to, "cannot transfer to self" );
    check( is_account(to), "to account does not exist" );
    check( _g.supply.symbol == quantity.symbol, "symbol mismatch" );
    check( !_g.paused, "token transfer paused" );
    check( quantity.is_valid(), "invalid quantity" );
    check( quantity.amount > 0, "must transfer positive quantity" );
    check( memo.size() <= 256, "memo has more than 256 bytes" );

    require_recipient( from );
    require_recipient( to );

    _debit( from, quantity );
    _credit( to, quantity, has_auth(to) ? to : from );
}

//debits `owner`, the row is kept at zero so later credits reuse its RAM
void xtoken::_debit(const name& owner, const asset& quant)
{
    accounts accts( _self, owner.value );
    auto itr = accts.find( quant.symbol.code().raw() );
    check( itr != accts.end() && itr->balance >= quant, "overdrawn balance of " + owner.to_string() );

    accts.modify( itr, same_payer, [&](auto& a) { a.balance -= quant; } );
}

void xtoken::_credit(const name& owner, const asset& quant, const name& ram_payer)
{
    accounts accts( _self, owner.value );
    auto itr = accts.find( quant.symbol.code().raw() );
    if (itr != accts.end())
        accts.modify( itr, same_payer, [&](auto& a) { a.balance += quant; } );
    else
        accts.emplace( ram_payer, [&](auto& a) { a.balance = quant; } );
}

} /// namespace raffle_token
