/**
 * @file results.cpp
 * @brief Column groups of the result table.
 */

#include <algorithm>

#include <bodytherm/biology/results.hpp>
#include <bodytherm/core/errors.hpp>

namespace bodytherm {
namespace biology {

namespace {

using core::SegmentArray;

enum class Shape : uint8_t { SCALAR, SEGMENT, SFVEIN, MUSCLE, FAT };

using Extractor = std::vector<double> (*)(const ResultRow &);

struct ColumnGroup {
  const char *key;
  Shape shape;
  Extractor values;
};

std::vector<double> seg(const SegmentArray &a) {
  return std::vector<double>(a.begin(), a.end());
}

std::vector<double> pick(const SegmentArray &a,
                         const std::vector<size_t> &segments) {
  std::vector<double> out;
  out.reserve(segments.size());
  for (size_t s : segments)
    out.push_back(a[s]);
  return out;
}

const std::vector<ColumnGroup> &default_groups() {
  static const std::vector<ColumnGroup> groups = {
      {"CycleTime", Shape::SCALAR,
       [](const ResultRow &r) {
         return std::vector<double>{static_cast<double>(r.cycle)};
       }},
      {"ModTime", Shape::SCALAR,
       [](const ResultRow &r) { return std::vector<double>{r.time_s}; }},
      {"dt", Shape::SCALAR,
       [](const ResultRow &r) { return std::vector<double>{r.dt_s}; }},
      {"TskMean", Shape::SCALAR,
       [](const ResultRow &r) { return std::vector<double>{r.tsk_mean}; }},
      {"Tsk", Shape::SEGMENT,
       [](const ResultRow &r) { return seg(r.state.skin()); }},
      {"Tcr", Shape::SEGMENT,
       [](const ResultRow &r) { return seg(r.state.core()); }},
      {"WetMean", Shape::SCALAR,
       [](const ResultRow &r) { return std::vector<double>{r.wet_mean}; }},
      {"Wet", Shape::SEGMENT,
       [](const ResultRow &r) { return seg(r.signals.wet); }},
      {"Wle", Shape::SCALAR,
       [](const ResultRow &r) {
         return std::vector<double>{r.weight_loss_g_s};
       }},
      {"Met", Shape::SCALAR,
       [](const ResultRow &r) {
         return std::vector<double>{r.production.total()};
       }},
      {"RES", Shape::SCALAR,
       [](const ResultRow &r) {
         return std::vector<double>{r.respiration.total()};
       }},
      {"THLsk", Shape::SCALAR,
       [](const ResultRow &r) {
         return std::vector<double>{r.skin_heat_loss_w};
       }},
  };
  return groups;
}

const std::vector<ColumnGroup> &extra_groups() {
  static const std::vector<ColumnGroup> groups = {
      {"BSA", Shape::SEGMENT, [](const ResultRow &r) { return seg(r.bsa); }},
      {"Ret", Shape::SEGMENT,
       [](const ResultRow &r) { return seg(r.resistances.ret); }},
      {"Rt", Shape::SEGMENT,
       [](const ResultRow &r) { return seg(r.resistances.rt); }},
      {"To", Shape::SEGMENT,
       [](const ResultRow &r) { return seg(r.resistances.to); }},
      {"hc", Shape::SEGMENT,
       [](const ResultRow &r) { return seg(r.resistances.hc); }},
      {"hr", Shape::SEGMENT,
       [](const ResultRow &r) { return seg(r.resistances.hr); }},
      {"Esk", Shape::SEGMENT,
       [](const ResultRow &r) { return seg(r.signals.e_sk); }},
      {"Emax", Shape::SEGMENT,
       [](const ResultRow &r) { return seg(r.signals.e_max); }},
      {"Esweat", Shape::SEGMENT,
       [](const ResultRow &r) { return seg(r.signals.e_sweat); }},
      {"BFcr", Shape::SEGMENT,
       [](const ResultRow &r) { return seg(r.flows.core_lh); }},
      {"BFms", Shape::MUSCLE,
       [](const ResultRow &r) {
         return pick(r.flows.muscle_lh, core::node_layout().muscle_segments);
       }},
      {"BFfat", Shape::FAT,
       [](const ResultRow &r) {
         return pick(r.flows.fat_lh, core::node_layout().fat_segments);
       }},
      {"BFsk", Shape::SEGMENT,
       [](const ResultRow &r) { return seg(r.flows.skin_lh); }},
      {"BFava_hand", Shape::SCALAR,
       [](const ResultRow &r) {
         return std::vector<double>{r.flows.ava_hand_lh};
       }},
      {"BFava_foot", Shape::SCALAR,
       [](const ResultRow &r) {
         return std::vector<double>{r.flows.ava_foot_lh};
       }},
      {"CO", Shape::SCALAR,
       [](const ResultRow &r) {
         return std::vector<double>{r.flows.cardiac_output_lh};
       }},
      {"Mwork", Shape::SEGMENT,
       [](const ResultRow &r) { return seg(r.production.work_w); }},
      {"Mshiv", Shape::SEGMENT,
       [](const ResultRow &r) { return seg(r.signals.shivering); }},
      {"Mnst", Shape::SEGMENT,
       [](const ResultRow &r) { return seg(r.signals.nonshivering); }},
      {"Qcr", Shape::SEGMENT,
       [](const ResultRow &r) { return seg(r.production.core_w); }},
      {"Qms", Shape::MUSCLE,
       [](const ResultRow &r) {
         return pick(r.production.muscle_w,
                     core::node_layout().muscle_segments);
       }},
      {"Qfat", Shape::FAT,
       [](const ResultRow &r) {
         return pick(r.production.fat_w, core::node_layout().fat_segments);
       }},
      {"Qsk", Shape::SEGMENT,
       [](const ResultRow &r) { return seg(r.production.skin_w); }},
      {"SHLsk", Shape::SEGMENT,
       [](const ResultRow &r) { return seg(r.sensible_loss_w); }},
      {"LHLsk", Shape::SEGMENT,
       [](const ResultRow &r) { return seg(r.signals.e_sk); }},
      {"RESsh", Shape::SCALAR,
       [](const ResultRow &r) {
         return std::vector<double>{r.respiration.sensible_w};
       }},
      {"RESlh", Shape::SCALAR,
       [](const ResultRow &r) {
         return std::vector<double>{r.respiration.latent_w};
       }},
      {"Ta", Shape::SEGMENT,
       [](const ResultRow &r) { return seg(r.conditions.ta()); }},
      {"Tr", Shape::SEGMENT,
       [](const ResultRow &r) { return seg(r.conditions.tr()); }},
      {"Va", Shape::SEGMENT,
       [](const ResultRow &r) { return seg(r.conditions.va()); }},
      {"RH", Shape::SEGMENT,
       [](const ResultRow &r) { return seg(r.conditions.rh()); }},
      {"Icl", Shape::SEGMENT,
       [](const ResultRow &r) { return seg(r.conditions.icl()); }},
      {"PAR", Shape::SCALAR,
       [](const ResultRow &r) {
         return std::vector<double>{r.conditions.par()};
       }},
      // 0 standing, 1 sitting, 2 lying
      {"Posture", Shape::SCALAR,
       [](const ResultRow &r) {
         return std::vector<double>{
             static_cast<double>(r.conditions.posture())};
       }},
      {"Tcb", Shape::SCALAR,
       [](const ResultRow &r) {
         return std::vector<double>{r.state.central_blood()};
       }},
      {"Tar", Shape::SEGMENT,
       [](const ResultRow &r) { return seg(r.state.artery()); }},
      {"Tve", Shape::SEGMENT,
       [](const ResultRow &r) { return seg(r.state.vein()); }},
      {"Tsve", Shape::SFVEIN,
       [](const ResultRow &r) { return r.state.sfvein(); }},
      {"Tms", Shape::MUSCLE,
       [](const ResultRow &r) { return r.state.muscle(); }},
      {"Tfat", Shape::FAT, [](const ResultRow &r) { return r.state.fat(); }},
      {"Setptcr", Shape::SEGMENT,
       [](const ResultRow &r) { return seg(r.setpoint_cr); }},
      {"Setptsk", Shape::SEGMENT,
       [](const ResultRow &r) { return seg(r.setpoint_sk); }},
      {"Wrms", Shape::SCALAR,
       [](const ResultRow &r) { return std::vector<double>{r.signals.wrms}; }},
      {"Clds", Shape::SCALAR,
       [](const ResultRow &r) { return std::vector<double>{r.signals.clds}; }},
  };
  return groups;
}

void append_names(std::vector<std::string> &names, const ColumnGroup &group) {
  const auto &layout = core::node_layout();
  auto by_segments = [&](const std::vector<size_t> &segments) {
    for (size_t s : segments)
      names.push_back(std::string(group.key) + "_" + core::SEGMENT_NAMES[s]);
  };

  switch (group.shape) {
  case Shape::SCALAR:
    names.emplace_back(group.key);
    break;
  case Shape::SEGMENT:
    for (const char *seg_name : core::SEGMENT_NAMES)
      names.push_back(std::string(group.key) + "_" + seg_name);
    break;
  case Shape::SFVEIN:
    by_segments(layout.sfvein_segments);
    break;
  case Shape::MUSCLE:
    by_segments(layout.muscle_segments);
    break;
  case Shape::FAT:
    by_segments(layout.fat_segments);
    break;
  }
}

std::vector<const ColumnGroup *> selected_groups(const OutputSelector &sel) {
  std::vector<const ColumnGroup *> out;
  for (const auto &g : default_groups())
    out.push_back(&g);
  for (const auto &g : extra_groups()) {
    if (sel.includes(g.key))
      out.push_back(&g);
  }
  return out;
}

} // namespace

// ============================================================================
// OutputSelector
// ============================================================================

OutputSelector::OutputSelector(const std::vector<std::string> &groups) {
  const auto &known = available();
  for (const auto &name : groups) {
    if (name == "all") {
      all_ = true;
      continue;
    }
    if (std::find(known.begin(), known.end(), name) == known.end()) {
      throw core::ConfigurationError("unknown extra output '" + name + "'");
    }
    if (std::find(groups_.begin(), groups_.end(), name) == groups_.end())
      groups_.push_back(name);
  }
}

OutputSelector OutputSelector::all() {
  OutputSelector sel;
  sel.all_ = true;
  return sel;
}

bool OutputSelector::includes(const std::string &group) const {
  if (all_)
    return true;
  return std::find(groups_.begin(), groups_.end(), group) != groups_.end();
}

const std::vector<std::string> &OutputSelector::available() {
  static const std::vector<std::string> names = [] {
    std::vector<std::string> n;
    for (const auto &g : extra_groups())
      n.emplace_back(g.key);
    return n;
  }();
  return names;
}

// ============================================================================
// ResultLog
// ============================================================================

void ResultLog::append(ResultRow row) {
  row.flows.edges.clear();
  row.flows.edges.shrink_to_fit();
  rows_.push_back(std::move(row));
}

std::vector<std::string>
ResultLog::column_names(const OutputSelector &selector) {
  std::vector<std::string> names;
  for (const ColumnGroup *g : selected_groups(selector))
    append_names(names, *g);
  return names;
}

ResultTable ResultLog::table(const OutputSelector &selector) const {
  const auto groups = selected_groups(selector);
  const auto names = column_names(selector);

  ResultTable table;
  table.reserve(names.size());
  for (const auto &name : names) {
    table.emplace_back(name, std::vector<double>());
    table.back().second.reserve(rows_.size());
  }

  for (const auto &row : rows_) {
    size_t col = 0;
    for (const ColumnGroup *g : groups) {
      for (double v : g->values(row))
        table[col++].second.push_back(v);
    }
  }
  return table;
}

} // namespace biology
} // namespace bodytherm
