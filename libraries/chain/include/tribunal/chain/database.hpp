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
#pragma once

#include <tribunal/protocol/transaction.hpp>

#include <tribunal/chain/global_property_object.hpp>
#include <tribunal/chain/account_object.hpp>
#include <tribunal/chain/escrow_object.hpp>
#include <tribunal/chain/arbitrator_object.hpp>
#include <tribunal/chain/dispute_object.hpp>
#include <tribunal/chain/genesis_state.hpp>
#include <tribunal/chain/evaluator.hpp>
#include <tribunal/chain/ledger.hpp>
#include <tribunal/chain/arbitrator_metadata.hpp>
#include <tribunal/chain/operation_history_object.hpp>

#include <tribunal/db/object_database.hpp>
#include <tribunal/db/object.hpp>
#include <fc/signals.hpp>

#include <fc/log/logger.hpp>

namespace tribunal { namespace chain {
   using tribunal::db::abstract_object;
   using tribunal::db::object;
   class op_evaluator;

   /**
    *   @class database
    *   @brief tracks the escrow, dispute and arbitrator state
    *
    *   Every change is made by pushing a transaction. A transaction is applied inside an undo
    *   session, so a failing operation leaves no trace: object changes, custody movements made
    *   through the reference ledger, allocated ids and pending events are all dropped.
    *
    *   Each database is an isolated instance. The ledger and the arbitrator metadata source are
    *   injected and default to implementations that keep their state in this database.
    */
   class database : public db::object_database
   {
         //////////////////// db_management.cpp ////////////////////
      public:
         database();
         ~database() override;

         /// Replaces the value ledger. Must outlive every call into this database.
         void set_ledger( std::shared_ptr<ledger_interface> new_ledger );
         ledger_interface& ledger()const;

         /// Replaces the source of arbitrator reputation and participation readings
         void set_metadata_source( std::shared_ptr<arbitrator_metadata_source> source );
         const arbitrator_metadata_source& metadata_source()const;

         //////////////////// db_block.cpp ////////////////////
      public:
         /**
          * Applies all operations of @p trx in order, atomically.
          *
          * @throws reentrant_call if called while another transaction is being applied
          * @return the transaction with the result of every operation
          */
         processed_transaction push_transaction( const transaction& trx );

         /// Shorthand for a transaction holding the single operation @p op
         operation_result push_operation( const operation& op );

         operation_result apply_operation( const operation& op );

         /**
          * This method is used to track applied operations during the evaluation of a transaction.
          * Evaluators call it to record the virtual operations they produce.
          */
         uint32_t  push_applied_operation( const operation& op );
         void      set_applied_operation_result( uint32_t op_id, const operation_result& r );
         const vector<optional< operation_history_object > >& get_applied_operations()const;

         /// All deadlines are compared against this time
         time_point_sec head_time()const;

         /// Moves the head time forward by @p seconds
         void advance_time( uint32_t seconds );

         /// Moves the head time forward to @p new_time, which must not be in the past
         void set_head_time( time_point_sec new_time );

         //////////////////// db_notify.cpp ////////////////////
      public:
         /**
          *  This signal is emitted for every real and virtual operation of a transaction after the
          *  transaction has committed. Operations of a failed transaction are never published.
          */
         fc::signal<void(const operation_history_object&)> applied_operation;

         /**
          *  Emitted after all operations of a committed transaction have been published.
          */
         fc::signal<void(const processed_transaction&)>    applied_transaction;

      protected:
         void notify_applied_transaction( const processed_transaction& trx );

         //////////////////// db_genesis.cpp ////////////////////
      public:
         /// Creates the reserved accounts, the initial accounts and balances and the global properties
         void init_genesis( const genesis_state_type& genesis_state = genesis_state_type() );

         //////////////////// db_init.cpp ////////////////////
      private:
         template<typename EvaluatorType>
         void register_evaluator()
         {
            _operation_evaluators[
               operation::tag<typename EvaluatorType::operation_type>::value].reset( new op_evaluator_impl<EvaluatorType>() );
         }

         void initialize_evaluators();
         /// Reset the object graph in-memory
         void initialize_indexes();

         //////////////////// db_getter.cpp ////////////////////
      public:
         const global_property_object&          get_global_properties()const;
         const dynamic_global_property_object&  get_dynamic_global_properties()const;

         const account_object&  get_account_by_name( const string& name )const;
         const account_object*  find_account_by_name( const string& name )const;

         /// @throws escrow_not_found
         const escrow_object&   get_escrow( escrow_id_type id )const;
         const escrow_object*   find_escrow( escrow_id_type id )const;
         vector<escrow_id_type> get_escrows_by_buyer( account_id_type buyer )const;
         vector<escrow_id_type> get_escrows_by_seller( account_id_type seller )const;

         const dispute_commitment_object* find_dispute_commitment( escrow_id_type escrow )const;

         /// @throws fc::assert_exception if the escrow was never disputed
         const dispute_object&   get_dispute_by_escrow( escrow_id_type escrow )const;
         const dispute_object*   find_dispute_by_escrow( escrow_id_type escrow )const;
         vector<dispute_id_type> get_disputes_by_arbitrator( account_id_type arbitrator )const;

         /// @throws arbitrator_not_found
         const arbitrator_object& get_arbitrator( account_id_type account )const;
         const arbitrator_object* find_arbitrator( account_id_type account )const;
         /// in basis points, 0 for unknown arbitrators
         uint16_t get_arbitrator_success_rate( account_id_type account )const;
         bool     is_registered_arbitrator( account_id_type account )const;
         uint32_t get_active_arbitrator_count()const;

         /// Last time the assigned arbitrator may rule, the epoch if the escrow has no dispute
         time_point_sec get_dispute_deadline( escrow_id_type escrow )const;
         bool           is_dispute_timed_out( escrow_id_type escrow )const;

         digest_type compute_commitment( escrow_id_type escrow, const digest_type& nonce,
                                         account_id_type committer )const;

         //////////////////// db_balance.cpp ////////////////////
      public:
         /**
          * @brief Retrieve a particular account's balance in the reference ledger
          * @param owner Account whose balance should be retrieved
          * @return owner's balance, zero if the account never held funds
          */
         share_type get_balance( account_id_type owner )const;

         /**
          * @brief Adjust a particular account's balance in the reference ledger
          * @param account ID of account whose balance should be adjusted
          * @param delta Amount to adjust balance by
          */
         void adjust_balance( account_id_type account, share_type delta );

         /// Pulls @p amount from @p from into custody through the ledger. @throws insufficient_balance
         void deposit_to_custody( account_id_type from, share_type amount );

         /// Pays @p amount out of custody through the ledger. @throws transfer_failed
         void pay_from_custody( account_id_type to, share_type amount );

         //////////////////// db_arbitrator.cpp ////////////////////
      public:
         void record_case_opened( const arbitrator_object& arbitrator );
         void record_case_resolved( const arbitrator_object& arbitrator, bool success );

         /**
          * Folds a rating in [TRIBUNAL_MIN_RATING, TRIBUNAL_MAX_RATING] into the arbitrator's
          * reputation and emits reputation_updated.
          * @throws invalid_rating
          * @return the new reputation
          */
         uint32_t apply_rating( const arbitrator_object& arbitrator, uint8_t rating );

         //////////////////// db_dispute.cpp ////////////////////
      public:
         /**
          * Picks an arbitrator for the freshly revealed dispute of @p escrow, records the assignment
          * and rotates the selection seed.
          * @throws no_candidate_available, leaving the caller to unwind the reveal
          */
         const dispute_object& assign_arbitrator( const escrow_object& escrow, account_id_type disputer,
                                                  const digest_type& nonce );

         /// Closes @p dispute and pays out its escrow
         void close_dispute( const dispute_object& dispute, bool release_to_seller, bool by_ruling );

         /**
          * Pays the escrowed amount to the seller (minus the marketplace fee) or back to the
          * buyer, marks the escrow resolved and returns any dispute stake.
          */
         void pay_out_escrow( const escrow_object& escrow, bool release_to_seller );

         void return_dispute_stake( const escrow_object& escrow );

      private:
         vector< std::unique_ptr<op_evaluator> >    _operation_evaluators;

         std::shared_ptr<ledger_interface>           _ledger;
         std::shared_ptr<arbitrator_metadata_source> _metadata_source;

         vector<optional< operation_history_object > >  _applied_ops;
         uint16_t                                      _current_op_in_trx    = 0;
         uint16_t                                      _current_virtual_op   = 0;

         /// held by scoped_reentrancy_lock while a transaction is applied
         bool                                          _applying_transaction = false;
   };

} }
