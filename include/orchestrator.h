/**
 * @file orchestrator.h  Runs hostguard's periodic passes.
 *
 * Copyright (C) Metaswitch Networks 2018
 * If license terms are provided to you in a COPYING file in the root directory
 * of the source code repository by which you are accessing this code, then
 * the license outlined in that COPYING file applies to your use.
 * Otherwise no rights are granted except for those provided to you by
 * Metaswitch Networks in a separate written agreement.
 */

#ifndef ORCHESTRATOR_H__
#define ORCHESTRATOR_H__

#include <vector>

#include "monitored_variable.h"
#include "hosts_file.h"
#include "metrics_reporter.h"

class Orchestrator
{
public:
  Orchestrator(HostsFileWriter* writer,
               MetricsReporter* reporter,
               int interval_s = PASS_INTERVAL_S);
  ~Orchestrator();

  /// Takes ownership of the variable. Variables are processed in the order
  /// they are added.
  void add_variable(MonitoredVariable* variable);

  /// Runs one pass: picks a healthy address for every variable, reconciles
  /// the hosts file and reports the outcome. Never throws.
  ///
  /// @return the failures recorded in the pass, by (variable, reason). A
  ///         failure outside any single variable is recorded against "".
  FailureCounts run_pass();

  /// Runs passes every interval, forever.
  void run();

  static const int PASS_INTERVAL_S = 30;

  static const char* const REASON_NO_HEALTHY_ADDRESS;
  static const char* const REASON_UNRESOLVABLE;
  static const char* const REASON_ERROR;

private:
  void process(MonitoredVariable* variable,
               HostMappings& mappings,
               FailureCounts& failures);

  HostsFileWriter* _writer;
  MetricsReporter* _reporter;
  int _interval_s;
  std::vector<MonitoredVariable*> _variables;
};

#endif
