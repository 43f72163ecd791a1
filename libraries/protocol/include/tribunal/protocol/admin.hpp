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
#include <tribunal/protocol/chain_parameters.hpp>

namespace tribunal { namespace protocol {

   /**
    * @brief Replaces the escrow and arbitration parameters
    * @ingroup operations
    *
    * Requires the admin account. The new parameters apply to operations evaluated afterwards,
    * escrows keep the dispute stake they were created with.
    */
   struct parameters_update_operation : public base_operation
   {
      account_id_type  admin;
      chain_parameters new_parameters;

      account_id_type actor()const { return admin; }
      void            validate()const override;
   };

   /**
    * @brief Pauses or resumes the operations that open new positions
    * @ingroup operations
    *
    * While paused no escrow can be created, no dispute committed or revealed and no arbitrator
    * registered. Operations that pay out custody stay available.
    */
   struct pause_update_operation : public base_operation
   {
      account_id_type admin;
      bool            paused = false;

      account_id_type actor()const { return admin; }
      void            validate()const override;
   };

} } // tribunal::protocol

FC_REFLECT( tribunal::protocol::parameters_update_operation, (admin)(new_parameters) )
FC_REFLECT( tribunal::protocol::pause_update_operation, (admin)(paused) )
