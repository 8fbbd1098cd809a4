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
#include <boost/test/unit_test.hpp>

#include <aegis/chain/database.hpp>
#include <aegis/chain/escrow_object.hpp>
#include <aegis/chain/exceptions.hpp>
#include <aegis/chain/global_property_object.hpp>

#include "../common/database_fixture.hpp"

using namespace aegis::chain;
using namespace aegis::chain::test;

BOOST_FIXTURE_TEST_SUITE( escrow_tests, database_fixture )

BOOST_AUTO_TEST_CASE( escrow_create )
{ try {
   ACTORS( (client)(payee)(verifier1)(verifier2)(verifier3) );
   fund( client_id, 2000000 );

   const task_id_type task = make_task( "translate-docs" );
   BOOST_CHECK( db.get_escrow( task ).status == escrow_status::uninitialized );

   const size_t history_before = db.get_operation_history().size();
   const escrow_object& esc = create_escrow( client_id, task, payee_id, { verifier1_id, verifier2_id, verifier3_id },
                                             2, 500, 200, 1000000 );

   BOOST_CHECK_EQUAL( get_balance( client_id ).value, 1000000 );

   const escrow_object record = db.get_escrow( task );
   BOOST_CHECK( record.id == esc.id );
   BOOST_CHECK( record.depositor == client_id );
   BOOST_CHECK( record.payee == payee_id );
   BOOST_CHECK_EQUAL( record.amount.value, 1000000 );
   BOOST_CHECK_EQUAL( record.marketplace_fee_bps, 500 );
   BOOST_CHECK_EQUAL( record.verifier_fee_bps, 200 );
   BOOST_CHECK( record.status == escrow_status::funded );
   BOOST_CHECK_EQUAL( record.approvals_required, 2 );
   BOOST_CHECK_EQUAL( record.release_approvals, 0 );
   BOOST_CHECK_EQUAL( record.refund_approvals, 0 );

   const vector<account_id_type> verifiers = db.get_escrow_verifiers( task );
   BOOST_REQUIRE_EQUAL( verifiers.size(), 3u );
   BOOST_CHECK( verifiers[0] == verifier1_id );
   BOOST_CHECK( verifiers[1] == verifier2_id );
   BOOST_CHECK( verifiers[2] == verifier3_id );

   for( const auto& v : verifiers )
   {
      BOOST_CHECK( db.find_escrow_verifier( esc.get_id(), v ) != nullptr );
      BOOST_CHECK( !db.has_escrow_approval( task, v, escrow_path::release ) );
      BOOST_CHECK( !db.has_escrow_approval( task, v, escrow_path::refund ) );
   }
   BOOST_CHECK( db.find_escrow_verifier( esc.get_id(), payee_id ) == nullptr );

   // the creation event carries every parameter and the new escrow as its result
   const vector<operation_history_object> history = db.get_operation_history();
   BOOST_REQUIRE_EQUAL( history.size(), history_before + 1 );
   const operation_history_object& created = history.back();
   BOOST_REQUIRE_EQUAL( created.op.which(), operation::tag<escrow_create_operation>::value );
   const escrow_create_operation& op = created.op.get<escrow_create_operation>();
   BOOST_CHECK( op.task_id == task );
   BOOST_CHECK( op.payee == payee_id );
   BOOST_CHECK_EQUAL( op.verifiers.size(), 3u );
   BOOST_CHECK_EQUAL( op.approvals_required, 2 );
   BOOST_CHECK_EQUAL( op.amount.value, 1000000 );
   BOOST_CHECK( created.result.get<object_id_type>() == esc.id );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( escrow_create_failures )
{ try {
   ACTORS( (client)(payee)(verifier1)(verifier2)(verifier3) );
   fund( client_id, 1000 );

   const task_id_type task = make_task( "task" );

   AEGIS_REQUIRE_THROW( create_escrow( client_id, task, payee_id, { verifier1_id }, 1, 0, 0, 1001 ),
                        escrow_create_insufficient_balance );
   AEGIS_REQUIRE_THROW( create_escrow( client_id, task, account_id_type( 9999 ), { verifier1_id }, 1, 0, 0, 100 ),
                        fc::exception );
   AEGIS_REQUIRE_THROW( create_escrow( client_id, task, payee_id, { verifier1_id, account_id_type( 9999 ) }, 1, 0, 0, 100 ),
                        fc::exception );
   AEGIS_REQUIRE_THROW( create_escrow( client_id, task, payee_id, { verifier1_id, verifier1_id }, 1, 0, 0, 100 ),
                        escrow_duplicate_verifier );

   // nothing was locked by the failed attempts
   BOOST_CHECK_EQUAL( get_balance( client_id ).value, 1000 );
   BOOST_CHECK( db.find_escrow( task ) == nullptr );

   create_escrow( client_id, task, payee_id, { verifier1_id }, 1, 0, 0, 400 );
   AEGIS_REQUIRE_THROW( create_escrow( client_id, task, payee_id, { verifier2_id }, 1, 0, 0, 100 ),
                        escrow_create_already_exists );
   BOOST_CHECK_EQUAL( get_balance( client_id ).value, 600 );

   // the chain parameter may lower the verifier ceiling
   db.modify( db.get_global_properties(), []( global_property_object& p ) {
      p.parameters.max_escrow_verifiers = 2;
   });
   AEGIS_REQUIRE_THROW( create_escrow( client_id, make_task( "too-many" ), payee_id,
                                       { verifier1_id, verifier2_id, verifier3_id }, 1, 0, 0, 100 ),
                        escrow_invalid_verifier_configuration );
   create_escrow( client_id, make_task( "just-enough" ), payee_id, { verifier1_id, verifier2_id }, 1, 0, 0, 100 );
   BOOST_CHECK_EQUAL( get_balance( client_id ).value, 500 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( release_with_fees )
{ try {
   ACTORS( (client)(payee)(verifier1)(verifier2)(verifier3) );
   // 10e18 at 5% and 2% scaled down to 1000000, since share_type is int64
   fund( client_id, 1000000 );

   const task_id_type task = make_task( "release" );
   const escrow_object& esc = create_escrow( client_id, task, payee_id, { verifier1_id, verifier2_id, verifier3_id },
                                             2, 500, 200, 1000000 );
   const escrow_id_type escrow_id = esc.get_id();
   BOOST_CHECK_EQUAL( get_balance( client_id ).value, 0 );

   approve_release( verifier1_id, task );
   BOOST_CHECK( esc.status == escrow_status::funded );
   BOOST_CHECK_EQUAL( esc.release_approvals, 1 );
   BOOST_CHECK( db.has_escrow_approval( task, verifier1_id, escrow_path::release ) );
   BOOST_CHECK( !db.has_escrow_approval( task, verifier1_id, escrow_path::refund ) );
   BOOST_CHECK_EQUAL( get_balance( payee_id ).value, 0 );

   vector<escrow_approved_operation> progress = get_history_ops<escrow_approved_operation>();
   BOOST_REQUIRE_EQUAL( progress.size(), 1u );
   BOOST_CHECK( progress[0].task_id == task );
   BOOST_CHECK( progress[0].verifier == verifier1_id );
   BOOST_CHECK( progress[0].path == escrow_path::release );
   BOOST_CHECK_EQUAL( progress[0].approvals, 1 );
   BOOST_CHECK_EQUAL( progress[0].approvals_required, 2 );

   const share_type treasury_before = get_balance( treasury_account );
   approve_release( verifier2_id, task );

   BOOST_CHECK( esc.status == escrow_status::released );
   BOOST_CHECK_EQUAL( esc.amount.value, 0 );
   BOOST_CHECK_EQUAL( esc.release_approvals, 2 );
   BOOST_CHECK_EQUAL( get_balance( payee_id ).value, 930000 );
   BOOST_CHECK_EQUAL( ( get_balance( treasury_account ) - treasury_before ).value, 50000 );
   BOOST_CHECK_EQUAL( get_balance( verifier1_id ).value, 10000 );
   BOOST_CHECK_EQUAL( get_balance( verifier2_id ).value, 10000 );
   BOOST_CHECK_EQUAL( get_balance( verifier3_id ).value, 0 );

   // verifier bookkeeping is gone, the record stays queryable
   BOOST_CHECK( db.get_escrow_verifiers( task ).empty() );
   BOOST_CHECK( db.find_escrow_verifier( escrow_id, verifier1_id ) == nullptr );
   BOOST_CHECK( db.find_escrow_verifier( escrow_id, verifier3_id ) == nullptr );
   BOOST_CHECK( !db.has_escrow_approval( task, verifier1_id, escrow_path::release ) );
   BOOST_CHECK( db.get_escrow( task ).status == escrow_status::released );

   vector<escrow_released_operation> released = get_history_ops<escrow_released_operation>();
   BOOST_REQUIRE_EQUAL( released.size(), 1u );
   BOOST_CHECK( released[0].task_id == task );
   BOOST_CHECK( released[0].payee == payee_id );
   BOOST_CHECK_EQUAL( released[0].payee_amount.value, 930000 );
   BOOST_CHECK_EQUAL( released[0].marketplace_fee.value, 50000 );
   BOOST_CHECK_EQUAL( released[0].verifier_fee_paid.value, 20000 );
   BOOST_CHECK_EQUAL( released[0].approvals, 2 );
   BOOST_CHECK( get_history_ops<escrow_refunded_operation>().empty() );

   // the record is terminal for both paths
   AEGIS_REQUIRE_THROW( approve_release( verifier3_id, task ), escrow_invalid_state );
   AEGIS_REQUIRE_THROW( approve_refund( verifier3_id, task ), escrow_invalid_state );
   AEGIS_REQUIRE_THROW( approve_release( verifier1_id, task ), escrow_invalid_state );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( release_fee_remainder )
{ try {
   ACTORS( (client)(payee)(verifier1)(verifier2)(verifier3) );
   fund( client_id, 1000050 );

   const task_id_type task = make_task( "odd-amount" );
   create_escrow( client_id, task, payee_id, { verifier1_id, verifier2_id, verifier3_id }, 2, 500, 200, 1000050 );

   const share_type treasury_before = get_balance( treasury_account );
   // approval order does not decide who gets the extra unit, list order does
   approve_release( verifier2_id, task );
   approve_release( verifier1_id, task );

   BOOST_CHECK_EQUAL( get_balance( payee_id ).value, 930047 );
   BOOST_CHECK_EQUAL( ( get_balance( treasury_account ) - treasury_before ).value, 50002 );
   BOOST_CHECK_EQUAL( get_balance( verifier1_id ).value, 10001 );
   BOOST_CHECK_EQUAL( get_balance( verifier2_id ).value, 10000 );
   BOOST_CHECK_EQUAL( get_balance( verifier3_id ).value, 0 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( refund_with_fees )
{ try {
   ACTORS( (client)(payee)(verifier1)(verifier2)(verifier3) );
   fund( client_id, 500000 );

   const task_id_type task = make_task( "refund" );
   const escrow_object& esc = create_escrow( client_id, task, payee_id, { verifier1_id, verifier2_id, verifier3_id },
                                             2, 500, 200, 500000 );

   const share_type treasury_before = get_balance( treasury_account );
   approve_refund( verifier2_id, task );
   BOOST_CHECK( esc.status == escrow_status::funded );
   BOOST_CHECK_EQUAL( esc.refund_approvals, 1 );
   approve_refund( verifier3_id, task );

   BOOST_CHECK( esc.status == escrow_status::refunded );
   BOOST_CHECK_EQUAL( esc.amount.value, 0 );
   BOOST_CHECK_EQUAL( get_balance( client_id ).value, 490000 );
   BOOST_CHECK_EQUAL( get_balance( payee_id ).value, 0 );
   BOOST_CHECK_EQUAL( get_balance( verifier1_id ).value, 0 );
   BOOST_CHECK_EQUAL( get_balance( verifier2_id ).value, 5000 );
   BOOST_CHECK_EQUAL( get_balance( verifier3_id ).value, 5000 );
   // no marketplace fee on refunds
   BOOST_CHECK( get_balance( treasury_account ) == treasury_before );

   vector<escrow_refunded_operation> refunded = get_history_ops<escrow_refunded_operation>();
   BOOST_REQUIRE_EQUAL( refunded.size(), 1u );
   BOOST_CHECK( refunded[0].depositor == client_id );
   BOOST_CHECK_EQUAL( refunded[0].refund_amount.value, 490000 );
   BOOST_CHECK_EQUAL( refunded[0].verifier_fee_paid.value, 10000 );
   BOOST_CHECK_EQUAL( refunded[0].approvals, 2 );
   BOOST_CHECK( get_history_ops<escrow_released_operation>().empty() );

   AEGIS_REQUIRE_THROW( approve_release( verifier1_id, task ), escrow_invalid_state );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( approval_errors )
{ try {
   ACTORS( (client)(payee)(verifier1)(verifier2)(outsider) );
   fund( client_id, 1000 );

   const task_id_type task = make_task( "errors" );
   create_escrow( client_id, task, payee_id, { verifier1_id, verifier2_id }, 2, 0, 0, 1000 );

   AEGIS_REQUIRE_THROW( approve_release( outsider_id, task ), escrow_unauthorized );
   AEGIS_REQUIRE_THROW( approve_refund( outsider_id, task ), escrow_unauthorized );
   AEGIS_REQUIRE_THROW( approve_release( payee_id, task ), escrow_unauthorized );
   AEGIS_REQUIRE_THROW( approve_release( client_id, task ), escrow_unauthorized );

   approve_release( verifier1_id, task );
   AEGIS_REQUIRE_THROW( approve_release( verifier1_id, task ), escrow_already_approved );
   REQUIRE_EXCEPTION_WITH_TEXT( approve_release( verifier1_id, task ), "already approved" );

   // nothing was counted twice
   BOOST_CHECK_EQUAL( db.get_escrow( task ).release_approvals, 1 );
   BOOST_CHECK_EQUAL( get_history_ops<escrow_approved_operation>().size(), 1u );

   AEGIS_REQUIRE_THROW( approve_release( verifier1_id, make_task( "no-such-task" ) ), escrow_invalid_state );
   AEGIS_REQUIRE_THROW( approve_refund( verifier1_id, make_task( "no-such-task" ) ), escrow_invalid_state );

   // every approval error is an escrow_exception
   AEGIS_REQUIRE_THROW( approve_release( outsider_id, task ), escrow_exception );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( paths_are_independent )
{ try {
   ACTORS( (client)(payee)(verifier1)(verifier2)(verifier3) );
   fund( client_id, 100000 );

   const task_id_type task = make_task( "contested" );
   const escrow_object& esc = create_escrow( client_id, task, payee_id, { verifier1_id, verifier2_id, verifier3_id },
                                             2, 1000, 1000, 100000 );

   // a verifier may vote on both paths; each vote counts on its own track only
   approve_release( verifier1_id, task );
   approve_refund( verifier1_id, task );
   BOOST_CHECK_EQUAL( esc.release_approvals, 1 );
   BOOST_CHECK_EQUAL( esc.refund_approvals, 1 );
   BOOST_CHECK( db.has_escrow_approval( task, verifier1_id, escrow_path::release ) );
   BOOST_CHECK( db.has_escrow_approval( task, verifier1_id, escrow_path::refund ) );

   approve_release( verifier3_id, task );
   BOOST_CHECK( esc.status == escrow_status::released );

   // only release approvers share the fee, in list order
   BOOST_CHECK_EQUAL( get_balance( payee_id ).value, 80000 );
   BOOST_CHECK_EQUAL( get_balance( verifier1_id ).value, 5000 );
   BOOST_CHECK_EQUAL( get_balance( verifier2_id ).value, 0 );
   BOOST_CHECK_EQUAL( get_balance( verifier3_id ).value, 5000 );

   // the losing path is closed
   AEGIS_REQUIRE_THROW( approve_refund( verifier2_id, task ), escrow_invalid_state );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( single_approval_quorum )
{ try {
   ACTORS( (client)(payee)(verifier1)(verifier2) );
   fund( client_id, 10000 );

   const task_id_type task = make_task( "quick" );
   create_escrow( client_id, task, payee_id, { verifier1_id, verifier2_id }, 1, 100, 100, 10000 );

   const size_t history_before = db.get_operation_history().size();
   approve_release( verifier2_id, task );

   // the deciding vote records the approval then the payout, both under the same operation
   const vector<operation_history_object> history = db.get_operation_history();
   BOOST_REQUIRE_EQUAL( history.size(), history_before + 3 );
   const operation_history_object& vote     = history[history_before];
   const operation_history_object& progress = history[history_before + 1];
   const operation_history_object& payout   = history[history_before + 2];
   BOOST_CHECK_EQUAL( vote.op.which(), operation::tag<escrow_approve_release_operation>::value );
   BOOST_CHECK_EQUAL( progress.op.which(), operation::tag<escrow_approved_operation>::value );
   BOOST_CHECK_EQUAL( payout.op.which(), operation::tag<escrow_released_operation>::value );
   BOOST_CHECK_EQUAL( vote.trx_num, progress.trx_num );
   BOOST_CHECK_EQUAL( vote.trx_num, payout.trx_num );
   BOOST_CHECK_EQUAL( vote.virtual_op, 0 );
   BOOST_CHECK_EQUAL( progress.virtual_op, 1 );
   BOOST_CHECK_EQUAL( payout.virtual_op, 2 );

   BOOST_CHECK_EQUAL( get_balance( payee_id ).value, 9800 );
   BOOST_CHECK_EQUAL( get_balance( verifier2_id ).value, 100 );
   BOOST_CHECK_EQUAL( get_balance( verifier1_id ).value, 0 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( task_id_cannot_be_reused )
{ try {
   ACTORS( (client)(payee)(verifier1) );
   fund( client_id, 2000 );

   const task_id_type task = make_task( "once" );
   create_escrow( client_id, task, payee_id, { verifier1_id }, 1, 0, 0, 1000 );
   approve_refund( verifier1_id, task );
   BOOST_CHECK( db.get_escrow( task ).status == escrow_status::refunded );
   BOOST_CHECK_EQUAL( get_balance( client_id ).value, 2000 );

   AEGIS_REQUIRE_THROW( create_escrow( client_id, task, payee_id, { verifier1_id }, 1, 0, 0, 1000 ),
                        escrow_create_already_exists );

   // a used id is reported as such whatever else is wrong with the request
   AEGIS_REQUIRE_THROW( create_escrow( client_id, task, payee_id, { verifier1_id }, 1, 0, 0, 0 ),
                        escrow_create_already_exists );
   AEGIS_REQUIRE_THROW( create_escrow( client_id, task, payee_id, { verifier1_id }, 1, 6000, 5000, 1000 ),
                        escrow_create_already_exists );
   AEGIS_REQUIRE_THROW( create_escrow( client_id, task, payee_id, { verifier1_id, verifier1_id }, 1, 0, 0, 1000 ),
                        escrow_create_already_exists );
   AEGIS_REQUIRE_THROW( create_escrow( client_id, task, payee_id, { verifier1_id }, 0, 0, 0, 1000 ),
                        escrow_create_already_exists );
   BOOST_CHECK_EQUAL( get_balance( client_id ).value, 2000 );
   BOOST_CHECK( db.get_escrow( task ).status == escrow_status::refunded );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( unapproved_finalization_pays_treasury )
{ try {
   ACTORS( (client)(payee)(verifier1)(verifier2) );
   fund( client_id, 2000000 );

   const task_id_type released_task = make_task( "released-unapproved" );
   const escrow_object& released_esc = create_escrow( client_id, released_task, payee_id, { verifier1_id, verifier2_id },
                                                      2, 500, 200, 1000000 );
   const task_id_type refunded_task = make_task( "refunded-unapproved" );
   const escrow_object& refunded_esc = create_escrow( client_id, refunded_task, payee_id, { verifier1_id, verifier2_id },
                                                      2, 500, 200, 1000000 );
   BOOST_CHECK_EQUAL( get_balance( client_id ).value, 0 );

   // with no approver on record the verifier fee goes to the treasury
   share_type treasury_before = get_balance( treasury_account );
   db.finalize_escrow( released_esc, escrow_path::release );

   BOOST_CHECK( db.get_escrow( released_task ).status == escrow_status::released );
   BOOST_CHECK_EQUAL( get_balance( payee_id ).value, 930000 );
   BOOST_CHECK_EQUAL( ( get_balance( treasury_account ) - treasury_before ).value, 50000 + 20000 );
   BOOST_CHECK_EQUAL( get_balance( verifier1_id ).value, 0 );
   BOOST_CHECK_EQUAL( get_balance( verifier2_id ).value, 0 );

   vector<escrow_released_operation> released = get_history_ops<escrow_released_operation>();
   BOOST_REQUIRE_EQUAL( released.size(), 1u );
   BOOST_CHECK_EQUAL( released[0].payee_amount.value, 930000 );
   BOOST_CHECK_EQUAL( released[0].marketplace_fee.value, 50000 );
   BOOST_CHECK_EQUAL( released[0].verifier_fee_paid.value, 20000 );
   BOOST_CHECK_EQUAL( released[0].approvals, 0 );

   treasury_before = get_balance( treasury_account );
   db.finalize_escrow( refunded_esc, escrow_path::refund );

   BOOST_CHECK( db.get_escrow( refunded_task ).status == escrow_status::refunded );
   BOOST_CHECK_EQUAL( get_balance( client_id ).value, 980000 );
   BOOST_CHECK_EQUAL( ( get_balance( treasury_account ) - treasury_before ).value, 20000 );
   BOOST_CHECK_EQUAL( get_balance( verifier1_id ).value, 0 );
   BOOST_CHECK_EQUAL( get_balance( verifier2_id ).value, 0 );

   vector<escrow_refunded_operation> refunded = get_history_ops<escrow_refunded_operation>();
   BOOST_REQUIRE_EQUAL( refunded.size(), 1u );
   BOOST_CHECK_EQUAL( refunded[0].refund_amount.value, 980000 );
   BOOST_CHECK_EQUAL( refunded[0].verifier_fee_paid.value, 20000 );
   BOOST_CHECK_EQUAL( refunded[0].approvals, 0 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( zero_fee_payouts )
{ try {
   ACTORS( (client)(payee)(verifier1)(verifier2) );
   fund( client_id, 1000 );

   const task_id_type task = make_task( "no-fees" );
   create_escrow( client_id, task, payee_id, { verifier1_id, verifier2_id }, 2, 0, 0, 1000 );

   const share_type treasury_before = get_balance( treasury_account );
   approve_release( verifier1_id, task );
   approve_release( verifier2_id, task );

   BOOST_CHECK_EQUAL( get_balance( payee_id ).value, 1000 );
   BOOST_CHECK( get_balance( treasury_account ) == treasury_before );
   BOOST_CHECK_EQUAL( get_balance( verifier1_id ).value, 0 );
   BOOST_CHECK_EQUAL( get_balance( verifier2_id ).value, 0 );

   vector<escrow_released_operation> released = get_history_ops<escrow_released_operation>();
   BOOST_REQUIRE_EQUAL( released.size(), 1u );
   BOOST_CHECK_EQUAL( released[0].marketplace_fee.value, 0 );
   BOOST_CHECK_EQUAL( released[0].verifier_fee_paid.value, 0 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( full_fee_release )
{ try {
   ACTORS( (client)(payee)(verifier1) );
   fund( client_id, 1000 );

   const task_id_type task = make_task( "all-fees" );
   create_escrow( client_id, task, payee_id, { verifier1_id }, 1, 7000, 3000, 1000 );

   const share_type treasury_before = get_balance( treasury_account );
   approve_release( verifier1_id, task );

   // a zero payee amount is skipped, the fees are still paid
   BOOST_CHECK_EQUAL( get_balance( payee_id ).value, 0 );
   BOOST_CHECK_EQUAL( ( get_balance( treasury_account ) - treasury_before ).value, 700 );
   BOOST_CHECK_EQUAL( get_balance( verifier1_id ).value, 300 );
   BOOST_CHECK( db.get_escrow( task ).status == escrow_status::released );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( many_escrows_are_independent )
{ try {
   ACTORS( (client)(payee)(verifier1)(verifier2) );
   fund( client_id, 3000 );

   const task_id_type first = make_task( "first" );
   const task_id_type second = make_task( "second" );
   create_escrow( client_id, first, payee_id, { verifier1_id, verifier2_id }, 2, 0, 0, 1000 );
   create_escrow( client_id, second, payee_id, { verifier2_id, verifier1_id }, 1, 0, 0, 2000 );

   approve_release( verifier1_id, first );
   BOOST_CHECK( !db.has_escrow_approval( second, verifier1_id, escrow_path::release ) );

   approve_refund( verifier2_id, second );
   BOOST_CHECK( db.get_escrow( second ).status == escrow_status::refunded );
   BOOST_CHECK( db.get_escrow( first ).status == escrow_status::funded );
   BOOST_CHECK_EQUAL( db.get_escrow_verifiers( first ).size(), 2u );
   BOOST_CHECK( db.has_escrow_approval( first, verifier1_id, escrow_path::release ) );
   BOOST_CHECK_EQUAL( get_balance( client_id ).value, 2000 );

   approve_release( verifier2_id, first );
   BOOST_CHECK_EQUAL( get_balance( payee_id ).value, 1000 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( escrow_and_approval_in_one_transaction )
{ try {
   ACTORS( (client)(payee)(verifier1)(outsider) );
   fund( client_id, 1000 );

   const task_id_type task = make_task( "atomic" );
   escrow_approve_release_operation approve;
   approve.task_id = task;

   // a failing approval unwinds the escrow created earlier in the transaction
   const size_t history_before = db.get_operation_history().size();
   trx.operations.push_back( make_escrow( client_id, task, payee_id, { verifier1_id }, 1, 0, 0, 1000 ) );
   approve.verifier = outsider_id;
   trx.operations.push_back( approve );
   AEGIS_REQUIRE_THROW( PUSH_TX( db, trx, ~0 ), escrow_unauthorized );
   trx.clear();

   BOOST_CHECK( db.find_escrow( task ) == nullptr );
   BOOST_CHECK_EQUAL( get_balance( client_id ).value, 1000 );
   BOOST_CHECK_EQUAL( db.get_operation_history().size(), history_before );

   trx.operations.push_back( make_escrow( client_id, task, payee_id, { verifier1_id }, 1, 0, 0, 1000 ) );
   approve.verifier = verifier1_id;
   trx.operations.push_back( approve );
   processed_transaction ptx = PUSH_TX( db, trx, ~0 );
   trx.clear();

   BOOST_REQUIRE_EQUAL( ptx.operation_results.size(), 2u );
   BOOST_CHECK( ptx.operation_results[0].get<object_id_type>() == db.get_escrow( task ).id );
   BOOST_CHECK( db.get_escrow( task ).status == escrow_status::released );
   BOOST_CHECK_EQUAL( get_balance( payee_id ).value, 1000 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()
