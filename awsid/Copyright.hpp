/*
 * awsid - validated, fixed-size AWS resource identifiers
 *
 * Distributed under the MIT License.
 */
