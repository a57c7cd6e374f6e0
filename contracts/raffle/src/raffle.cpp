#include <raffle/raffle.hpp>
#include <raffle.token/raffle.token.hpp>

namespace rafflefi {
using namespace std;

#define CHECKC(exp, code, msg) \
   { if (!(exp)) eosio::check(false, string("[[") + to_string((int)code) + string("]] ") + msg); }

   inline time_point_sec now_sec() {
      return time_point_sec(current_time_point());
   }

   inline math::bundle_terms_list to_terms(const vector<bundle_t>& bundles) {
      math::bundle_terms_list terms;
      for (size_t i = 0; i < bundles.size() && i < math::BUNDLE_COUNT; i++) {
         terms[i].amount   = bundles[i].amount;
         terms[i].price    = bundles[i].price.amount;
      }
      return terms;
   }

void raffle::init(const name& owner, const extended_asset& ticket_price, const uint8_t& duration_days,
                  const asset& fixed_prize, const name& donation) {
   require_auth( _self );
   CHECKC( !_gstate->initialized(), err::ALREADY_INITIALIZED, "raffle already initialized" );
   CHECKC( duration_days > 0, err::TIME_INVALID, "Future timestamp must be at least 1 day" );

   const auto& price = ticket_price.quantity;
   CHECKC( price.is_valid(), err::PARAM_ERROR, "invalid ticket price" );
   math::bundle_terms_list terms;
   CHECKC( math::make_bundles(price.amount, terms), err::INVALID_PURCHASE, "invalid ticket price" );

   CHECKC( is_account(ticket_price.contract), err::ACCOUNT_INVALID, "currency contract does not exist" );
   CHECKC( is_account(owner) && owner != _self, err::ACCOUNT_INVALID, "invalid owner: " + owner.to_string() );
   CHECKC( is_account(donation) && donation != _self, err::ACCOUNT_INVALID, "invalid donation account: " + donation.to_string() );
   CHECKC( fixed_prize.symbol == price.symbol, err::SYMBOL_MISMATCH, "fixed prize symbol mismatch" );
   CHECKC( fixed_prize.amount >= 0, err::PARAM_ERROR, "fixed prize can not be negative" );

   auto now = now_sec();
   auto end = now + uint32_t(duration_days * DAY_SECONDS);
   CHECKC( end > now, err::TIME_INVALID, "Future timestamp must be at least 1 day" );

   _gstate->owner             = owner;
   _gstate->currency          = ticket_price.get_extended_symbol();
   _gstate->ticket_price      = price;
   _gstate->bundles.clear();
   for (uint8_t i = 0; i < math::BUNDLE_COUNT; i++) {
      _gstate->bundles.push_back({ BUNDLE_TIERS[i], terms[i].amount, asset(terms[i].price, price.symbol) });
   }
   _gstate->started_at        = now;
   _gstate->raffle_end_date   = end;
   _gstate->fixed_prize       = fixed_prize;
   _gstate->donation_account  = donation;

   _gstate->pot               = asset(0, price.symbol);
   _gstate->collected         = asset(0, price.symbol);
   _gstate->distributed       = asset(0, price.symbol);
   _gstate->credits           = asset(0, price.symbol);
   _gstate->settlement.payout = { asset(0, price.symbol), asset(0, price.symbol), asset(0, price.symbol) };
   _gstate->change();
}

/**
 * @param from
 * @param to
 * @param quant
 * @param memo: three formats:
 *       1) bundle:$tier[:$referral]   - tiers: small, medium, large
 *       2) empty                      - largest bundle covered by the payment
 *       3) deposit                    - credit for buybundle
 */
void raffle::ontransfer(const name& from, const name& to, const asset& quant, const string& memo) {
   if (from == get_self() || to != get_self()) return;

   CHECKC( _gstate->initialized(), err::NOT_INITIALIZED, "raffle not initialized" );
   auto token_bank = get_first_receiver();
   CHECKC( token_bank == _gstate->currency.get_contract(), err::CONTRACT_MISMATCH, "unknown token bank: " + token_bank.to_string() );
   CHECKC( quant.symbol == _gstate->currency.get_symbol(), err::SYMBOL_MISMATCH, "symbol mismatch" );
   CHECKC( quant.amount > 0, err::PARAM_ERROR, "transfer amount must be positive" );

   if (memo.empty()) {
      _on_fallback(from, quant);
      return;
   }

   auto parts = split(memo, ":");
   if (parts[0] == "bundle") {
      CHECKC( parts.size() == 2 || (parts.size() == 3 && !parts[2].empty()), err::MEMO_FORMAT_ERROR, "memo format error: " + memo );
      auto tier      = name(parts[1]);
      auto referral  = parts.size() == 3 ? name(parts[2]) : name();

      _check_open();
      auto bundle    = _get_bundle(tier);
      _check_player(from);
      CHECKC( quant >= bundle.price, err::INSUFFICIENT_FUNDS, "Insufficient funds" );
      _check_referral(from, referral);
      _record_purchase(from, bundle, quant, referral);

   } else if (parts[0] == "deposit" && parts.size() == 1) {
      _on_deposit(from, quant);

   } else {
      CHECKC( false, err::MEMO_FORMAT_ERROR, "memo format error: " + memo );
   }
}

uint64_t raffle::buybundle(const name& player, const name& tier, const name& referral) {
   require_auth( player );

   _check_open();
   auto bundle = _get_bundle(tier);
   _check_player(player);

   credit_t::tbl_t credits(_self, _self.value);
   auto itr = credits.find(player.value);
   CHECKC( itr != credits.end() && itr->balance >= bundle.price, err::INSUFFICIENT_ALLOWANCE, "Insufficient allowance" );
   _check_referral(player, referral);

   if (itr->balance == bundle.price) {
      credits.erase(itr);
   } else {
      credits.modify(itr, same_payer, [&]( auto& c ) {
         c.balance     -= bundle.price;
         c.updated_at   = now_sec();
      });
   }
   _gstate->credits -= bundle.price;

   return _record_purchase(player, bundle, bundle.price, referral);
}

void raffle::refund(const name& player) {
   require_auth( player );
   CHECKC( _gstate->initialized(), err::NOT_INITIALIZED, "raffle not initialized" );

   credit_t::tbl_t credits(_self, _self.value);
   auto itr = credits.find(player.value);
   CHECKC( itr != credits.end(), err::PARAM_ERROR, "no credit found for " + player.to_string() );

   auto quant = itr->balance;
   credits.erase(itr);
   _gstate->credits -= quant;
   _gstate->change();

   TRANSFER( _gstate->currency.get_contract(), player, quant, "raffle credit refund" );
}

void raffle::freeticket(const name& player) {
   require_auth( player );
   _check_open();
   _check_player(player);

   player_t::tbl_t players(_self, _self.value);
   auto itr = players.find(player.value);
   CHECKC( itr == players.end() || (itr->tickets == 0 && !itr->free_claimed), err::ALREADY_CLAIMED, "User already owns tickets" );

   _add_tickets(player, 1, true);
}

name raffle::finish(const name& donation) {
   CHECKC( _gstate->initialized(), err::NOT_INITIALIZED, "raffle not initialized" );
   CHECKC( has_auth(_gstate->owner), err::NO_AUTH, "Invoker must be the owner" );
   CHECKC( !_gstate->settled(), err::ALREADY_SETTLED, "A winner has already been selected" );
   CHECKC( now_sec() >= _gstate->raffle_end_date, err::TIME_PREMATURE, "End date has not been reached yet" );
   CHECKC( _gstate->pot.amount > 0, err::EMPTY_POT, "The pot is empty. Raffle is invalid" );
   CHECKC( _gstate->sold_tickets > 0, err::NO_PARTICIPANTS, "No tickets have been sold" );

   auto donation_account = donation == name() ? _gstate->donation_account : donation;
   auto bank             = _gstate->currency.get_contract();
   auto pot              = _gstate->pot;

   auto balance = raffle_token::xtoken::get_balance(bank, _self, pot.symbol.code());
   ASSERT( balance >= pot + _gstate->credits );

   block_entropy entropy;
   auto the_winner = _pick_winner(entropy);
   _gstate->winner = the_winner;
   _gstate->change();

   auto split = math::split_pot(pot.amount, _gstate->fixed_prize.amount);
   distribution_t payout = { asset(split.prize, pot.symbol),
                             asset(split.donation, pot.symbol),
                             asset(split.commission, pot.symbol) };
   CHECK( payout.prize + payout.donation + payout.commission == pot, "pot split does not add up" );

   _transfer_out(the_winner, payout.prize, "raffle prize");
   _transfer_out(donation_account, payout.donation, "raffle donation");
   _transfer_out(_gstate->owner, payout.commission, "raffle commission");

   _gstate->settlement.payout             = payout;
   _gstate->settlement.donation_account   = donation_account;
   _gstate->settlement.settled_at         = now_sec();
   _gstate->distributed                  += pot;
   _gstate->pot.amount                    = 0;

   PRINT_PROPERTIES( PP0(the_winner), PP(pot), PP(payout.prize), PP(payout.donation),
                     PP(payout.commission), PP(donation_account) );

   WINNER_NOTIFY( the_winner, payout.prize );
   return the_winner;
}

uint64_t raffle::soldtickets() {
   CHECKC( _gstate->initialized(), err::NOT_INITIALIZED, "raffle not initialized" );
   CHECKC( has_auth(_gstate->owner), err::NO_AUTH, "Invoker must be the owner" );
   return _gstate->sold_tickets;
}

vector<bundle_t> raffle::getbundles() {
   CHECKC( _gstate->initialized(), err::NOT_INITIALIZED, "raffle not initialized" );
   return _gstate->bundles;
}

bundle_t raffle::getbundle(const name& tier) {
   CHECKC( _gstate->initialized(), err::NOT_INITIALIZED, "raffle not initialized" );
   return _get_bundle(tier);
}

uint64_t raffle::tickets(const name& player) {
   player_t::tbl_t players(_self, _self.value);
   auto itr = players.find(player.value);
   return itr == players.end() ? 0 : itr->tickets;
}

asset raffle::pot() {
   CHECKC( _gstate->initialized(), err::NOT_INITIALIZED, "raffle not initialized" );
   return _gstate->pot;
}

asset raffle::prizepool() {
   CHECKC( _gstate->initialized(), err::NOT_INITIALIZED, "raffle not initialized" );
   return _projected_distribution().prize;
}

asset raffle::donationamt() {
   CHECKC( _gstate->initialized(), err::NOT_INITIALIZED, "raffle not initialized" );
   return _projected_distribution().donation;
}

distribution_t raffle::distribution() {
   CHECKC( _gstate->initialized(), err::NOT_INITIALIZED, "raffle not initialized" );
   return _projected_distribution();
}

name raffle::winner() {
   return _gstate->winner;
}

time_point_sec raffle::enddate() {
   CHECKC( _gstate->initialized(), err::NOT_INITIALIZED, "raffle not initialized" );
   return _gstate->raffle_end_date;
}

void raffle::_check_open() {
   CHECKC( _gstate->initialized(), err::NOT_INITIALIZED, "raffle not initialized" );
   CHECKC( now_sec() < _gstate->raffle_end_date, err::TIME_EXPIRED, "Raffle is over" );
}

void raffle::_check_player(const name& player) {
   CHECKC( player != _gstate->owner, err::OWNER_EXCLUDED, "Owner cannot participate in the Raffle" );
}

bundle_t raffle::_get_bundle(const name& tier) {
   auto idx = tier_index(tier);
   CHECKC( idx < _gstate->bundles.size(), err::INVALID_PURCHASE, "invalid bundle: " + tier.to_string() );

   const auto& bundle = _gstate->bundles[idx];
   CHECKC( bundle.amount > 0 && bundle.price.amount > 0, err::INVALID_PURCHASE, "invalid bundle: " + tier.to_string() );
   return bundle;
}

void raffle::_check_referral(const name& player, const name& referral) {
   if (referral == name()) return;

   CHECKC( referral != player, err::SELF_REFERRAL, "User can not refer themselves" );
   player_t::tbl_t players(_self, _self.value);
   auto itr = players.find(referral.value);
   CHECKC( itr != players.end() && itr->tickets > 0, err::NOT_A_PLAYER, "Can only refer a user who owns a ticket" );
}

uint64_t raffle::_record_purchase(const name& player, const bundle_t& bundle, const asset& paid, const name& referral) {
   _add_tickets(player, bundle.amount);
   _gstate->pot        += paid;
   _gstate->collected  += paid;
   _gstate->change();

   if (referral != name())
      _grant_referral(referral, player);

   return bundle.amount;
}

void raffle::_add_tickets(const name& player, const uint64_t& amount, const bool& free_ticket) {
   player_t::tbl_t players(_self, _self.value);
   auto itr = players.find(player.value);
   if (itr == players.end()) {
      players.emplace(_self, [&]( auto& p ) {
         p.account      = player;
         p.seq          = _gstate->new_player_seq();
         p.tickets      = amount;
         p.free_claimed = free_ticket;
         p.joined_at    = now_sec();
      });
      _gstate->player_count++;

   } else {
      players.modify(itr, same_payer, [&]( auto& p ) {
         p.tickets     += amount;
         if (free_ticket) p.free_claimed = true;
      });
   }

   _gstate->sold_tickets += amount;
   _gstate->change();
}

void raffle::_grant_referral(const name& referral, const name& referrer) {
   player_t::tbl_t players(_self, _self.value);
   auto itr = players.find(referral.value);
   CHECKC( itr != players.end(), err::NOT_A_PLAYER, "Can only refer a user who owns a ticket" );

   players.modify(itr, same_payer, [&]( auto& p ) {
      p.tickets     += 1;
      p.referrals   += 1;
   });
   _gstate->sold_tickets += 1;
   _gstate->change();

   REFERRED_NOTIFY( referral, referrer );
}

void raffle::_on_fallback(const name& from, const asset& quant) {
   _check_open();
   _check_player(from);

   auto idx = math::classify_payment(to_terms(_gstate->bundles), quant.amount);
   CHECKC( idx < _gstate->bundles.size(), err::INSUFFICIENT_FUNDS, "Incorrect payment amount" );

   //overpayment stays in the pot
   _record_purchase(from, _gstate->bundles[idx], quant, name());
}

void raffle::_on_deposit(const name& from, const asset& quant) {
   _check_open();
   _check_player(from);

   credit_t::tbl_t credits(_self, _self.value);
   auto itr = credits.find(from.value);
   if (itr == credits.end()) {
      credits.emplace(_self, [&]( auto& c ) {
         c.owner       = from;
         c.balance     = quant;
         c.updated_at  = now_sec();
      });
   } else {
      credits.modify(itr, same_payer, [&]( auto& c ) {
         c.balance    += quant;
         c.updated_at  = now_sec();
      });
   }
   _gstate->credits += quant;
   _gstate->change();
}

name raffle::_pick_winner(entropy_source& entropy) {
   auto total = _gstate->sold_tickets;
   CHECKC( total > 0, err::NO_PARTICIPANTS, "No tickets have been sold" );

   entropy_seed seed = { total, _gstate->player_count, _gstate->pot.amount };
   auto roll = math::roll_of(entropy.next_random(seed), total);

   player_t::tbl_t players(_self, _self.value);
   auto by_seq = players.get_index<"byseq"_n>();
   auto itr = math::pick_weighted(by_seq.begin(), by_seq.end(), roll,
                                  [](const player_t& p) { return p.tickets; });
   CHECK( itr != by_seq.end(), "winner scan exhausted before reaching the roll" );
   return itr->account;
}

distribution_t raffle::_projected_distribution() const {
   const auto& sym = _gstate->pot.symbol;
   auto split = math::split_pot(_gstate->pot.amount, _gstate->fixed_prize.amount);
   return { asset(split.prize, sym), asset(split.donation, sym), asset(split.commission, sym) };
}

void raffle::_transfer_out(const name& to, const asset& quant, const string& memo) {
   if (quant.amount == 0) return;

   CHECKC( is_account(to) && to != _self, err::TRANSFER_FAILED,
           "Transfer of " + quant.to_string() + " to " + to.to_string() + " failed" );
   TRANSFER( _gstate->currency.get_contract(), to, quant, memo );
}

} //namespace rafflefi
