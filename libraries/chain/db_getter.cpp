/*
 * Copyright (c) 2015 Cryptonomex, Inc., and contributors.
 *
 * The MIT License
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
 * THE SOFTWARE.
 */
#include <tribunal/chain/database.hpp>
#include <tribunal/chain/exceptions.hpp>

#include <tribunal/protocol/dispute.hpp>

#include <boost/tuple/tuple.hpp>

namespace tribunal { namespace chain {

const global_property_object& database::get_global_properties()const
{
   return get( global_property_id_type() );
}

const dynamic_global_property_object& database::get_dynamic_global_properties()const
{
   return get( dynamic_global_property_id_type() );
}

const account_object& database::get_account_by_name( const string& name )const
{
   const account_object* account = find_account_by_name( name );
   FC_ASSERT( account != nullptr, "Unknown account ${n}", ("n",name) );
   return *account;
}

const account_object* database::find_account_by_name( const string& name )const
{
   const auto& idx = get_index_type<account_index>().indices().get<by_name>();
   auto itr = idx.find( name );
   if( itr == idx.end() )
      return nullptr;
   return &*itr;
}

const escrow_object& database::get_escrow( escrow_id_type id )const
{
   const escrow_object* escrow = find_escrow( id );
   TRIBUNAL_ASSERT( escrow != nullptr, escrow_not_found, "Escrow ${e} does not exist", ("e",id) );
   return *escrow;
}

const escrow_object* database::find_escrow( escrow_id_type id )const
{
   return find( id );
}

vector<escrow_id_type> database::get_escrows_by_buyer( account_id_type buyer )const
{
   vector<escrow_id_type> result;
   const auto& idx = get_index_type<escrow_index>().indices().get<by_buyer>();
   auto range = idx.equal_range( boost::make_tuple( buyer ) );
   for( auto itr = range.first; itr != range.second; ++itr )
      result.push_back( itr->get_id() );
   return result;
}

vector<escrow_id_type> database::get_escrows_by_seller( account_id_type seller )const
{
   vector<escrow_id_type> result;
   const auto& idx = get_index_type<escrow_index>().indices().get<by_seller>();
   auto range = idx.equal_range( boost::make_tuple( seller ) );
   for( auto itr = range.first; itr != range.second; ++itr )
      result.push_back( itr->get_id() );
   return result;
}

const dispute_commitment_object* database::find_dispute_commitment( escrow_id_type escrow )const
{
   const auto& idx = get_index_type<dispute_commitment_index>().indices().get<by_escrow>();
   auto itr = idx.find( escrow );
   if( itr == idx.end() )
      return nullptr;
   return &*itr;
}

const dispute_object& database::get_dispute_by_escrow( escrow_id_type escrow )const
{
   const dispute_object* dispute = find_dispute_by_escrow( escrow );
   FC_ASSERT( dispute != nullptr, "Escrow ${e} has no dispute", ("e",escrow) );
   return *dispute;
}

const dispute_object* database::find_dispute_by_escrow( escrow_id_type escrow )const
{
   const auto& idx = get_index_type<dispute_index>().indices().get<by_escrow>();
   auto itr = idx.find( escrow );
   if( itr == idx.end() )
      return nullptr;
   return &*itr;
}

vector<dispute_id_type> database::get_disputes_by_arbitrator( account_id_type arbitrator )const
{
   vector<dispute_id_type> result;
   const auto& idx = get_index_type<dispute_index>().indices().get<by_arbitrator>();
   auto range = idx.equal_range( boost::make_tuple( arbitrator ) );
   for( auto itr = range.first; itr != range.second; ++itr )
      result.push_back( itr->get_id() );
   return result;
}

const arbitrator_object& database::get_arbitrator( account_id_type account )const
{
   const arbitrator_object* arbitrator = find_arbitrator( account );
   TRIBUNAL_ASSERT( arbitrator != nullptr, arbitrator_not_found,
                    "Account ${a} is not a registered arbitrator", ("a",account) );
   return *arbitrator;
}

const arbitrator_object* database::find_arbitrator( account_id_type account )const
{
   const auto& idx = get_index_type<arbitrator_index>().indices().get<by_account>();
   auto itr = idx.find( account );
   if( itr == idx.end() )
      return nullptr;
   return &*itr;
}

uint16_t database::get_arbitrator_success_rate( account_id_type account )const
{
   const arbitrator_object* arbitrator = find_arbitrator( account );
   return arbitrator ? arbitrator->success_rate() : 0;
}

bool database::is_registered_arbitrator( account_id_type account )const
{
   const arbitrator_object* arbitrator = find_arbitrator( account );
   return arbitrator != nullptr && arbitrator->is_active;
}

uint32_t database::get_active_arbitrator_count()const
{
   const auto& idx = get_index_type<arbitrator_index>().indices().get<by_active>();
   auto range = idx.equal_range( boost::make_tuple( true ) );
   return static_cast<uint32_t>( std::distance( range.first, range.second ) );
}

time_point_sec database::get_dispute_deadline( escrow_id_type escrow )const
{
   const dispute_object* dispute = find_dispute_by_escrow( escrow );
   if( dispute == nullptr )
      return time_point_sec();
   return dispute->created_at + get_global_properties().parameters.dispute_timeout;
}

bool database::is_dispute_timed_out( escrow_id_type escrow )const
{
   const dispute_object* dispute = find_dispute_by_escrow( escrow );
   if( dispute == nullptr || dispute->is_resolved() )
      return false;
   return head_time() > get_dispute_deadline( escrow );
}

digest_type database::compute_commitment( escrow_id_type escrow, const digest_type& nonce,
                                          account_id_type committer )const
{
   return compute_dispute_commitment( escrow, nonce, committer );
}

} }
