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

#include <tribunal/protocol/base.hpp>

namespace tribunal { namespace protocol {

   /**
    * @brief Registers @ref account as an arbitrator candidate
    * @ingroup operations
    *
    * The account's reputation and participation readings are taken from the arbitrator metadata
    * source and must meet the configured minimums. @ref stake is locked until the arbitrator is
    * deactivated.
    */
   struct arbitrator_register_operation : public base_operation
   {
      account_id_type account;
      share_type      stake;

      account_id_type actor()const { return account; }
      void            validate()const override;
   };

   /**
    * @brief Re-reads the participation index of a registered arbitrator
    * @ingroup operations
    */
   struct arbitrator_refresh_operation : public base_operation
   {
      account_id_type account;

      account_id_type actor()const { return account; }
      void            validate()const override;
   };

   /**
    * @brief Removes an arbitrator from the selectable set
    * @ingroup operations
    *
    * Requires the admin account. Disputes already assigned to the arbitrator are not affected.
    */
   struct arbitrator_deactivate_operation : public base_operation
   {
      account_id_type admin;
      account_id_type arbitrator;

      account_id_type actor()const { return admin; }
      void            validate()const override;
   };

   /// Virtual op emitted when an account joins the registry
   struct arbitrator_registered_operation : public base_virtual_operation
   {
      arbitrator_registered_operation() = default;
      arbitrator_registered_operation( account_id_type a, uint32_t r, uint32_t p )
      : arbitrator(a), reputation(r), participation_index(p) {}

      account_id_type arbitrator;
      uint32_t        reputation = 0;
      uint32_t        participation_index = 0;

      account_id_type actor()const { return arbitrator; }
   };

   /// Virtual op emitted when an arbitrator is deactivated
   struct arbitrator_removed_operation : public base_virtual_operation
   {
      arbitrator_removed_operation() = default;
      explicit arbitrator_removed_operation( account_id_type a ) : arbitrator(a) {}

      account_id_type arbitrator;

      account_id_type actor()const { return arbitrator; }
   };

   /// Virtual op emitted when a rating moves an arbitrator's reputation
   struct reputation_updated_operation : public base_virtual_operation
   {
      reputation_updated_operation() = default;
      reputation_updated_operation( account_id_type a, uint32_t o, uint32_t n )
      : arbitrator(a), old_reputation(o), new_reputation(n) {}

      account_id_type arbitrator;
      uint32_t        old_reputation = 0;
      uint32_t        new_reputation = 0;

      account_id_type actor()const { return arbitrator; }
   };

} } // tribunal::protocol

FC_REFLECT( tribunal::protocol::arbitrator_register_operation, (account)(stake) )
FC_REFLECT( tribunal::protocol::arbitrator_refresh_operation, (account) )
FC_REFLECT( tribunal::protocol::arbitrator_deactivate_operation, (admin)(arbitrator) )
FC_REFLECT( tribunal::protocol::arbitrator_registered_operation, (arbitrator)(reputation)(participation_index) )
FC_REFLECT( tribunal::protocol::arbitrator_removed_operation, (arbitrator) )
FC_REFLECT( tribunal::protocol::reputation_updated_operation, (arbitrator)(old_reputation)(new_reputation) )
