#include "labsync/model/folder_structure.hpp"

#include <algorithm>
#include <array>
#include <utility>

namespace labsync::model {
namespace {

const std::array<std::pair<FolderStructure, const char*>, 6> kNames {{
    {FolderStructure::UsernameDataset, "Username / Dataset"},
    {FolderStructure::EmailDataset, "Email / Dataset"},
    {FolderStructure::UsernameExperimentDataset, "Username / Experiment / Dataset"},
    {FolderStructure::EmailExperimentDataset, "Email / Experiment / Dataset"},
    {FolderStructure::UsernameMarkerExperimentDataset, "Username / \"MyTardis\" / Experiment / Dataset"},
    {FolderStructure::GroupInstrumentFullNameDataset, "User Group / Instrument / Full Name / Dataset"},
}};

} // namespace

bool FolderLayout::has_segment(Segment segment) const {
    return std::find(segments.begin(), segments.end(), segment) != segments.end();
}

Result<FolderStructure> parse_folder_structure(const std::string& text) {
    for (const auto& [structure, name] : kNames) {
        if (text == name) {
            return Ok(structure);
        }
    }
    return Err(ErrorKind::Configuration, "Unsupported folder structure: \"" + text + "\"");
}

const char* folder_structure_name(FolderStructure structure) {
    for (const auto& [candidate, name] : kNames) {
        if (candidate == structure) {
            return name;
        }
    }
    return "Unknown";
}

const FolderLayout& layout_of(FolderStructure structure) {
    static const FolderLayout username_dataset {
        FolderStructure::UsernameDataset, IdentityKind::Username,
        {Segment::Identity, Segment::Dataset}};
    static const FolderLayout email_dataset {
        FolderStructure::EmailDataset, IdentityKind::Email,
        {Segment::Identity, Segment::Dataset}};
    static const FolderLayout username_experiment_dataset {
        FolderStructure::UsernameExperimentDataset, IdentityKind::Username,
        {Segment::Identity, Segment::Experiment, Segment::Dataset}};
    static const FolderLayout email_experiment_dataset {
        FolderStructure::EmailExperimentDataset, IdentityKind::Email,
        {Segment::Identity, Segment::Experiment, Segment::Dataset}};
    static const FolderLayout marker_layout {
        FolderStructure::UsernameMarkerExperimentDataset, IdentityKind::Username,
        {Segment::Identity, Segment::Marker, Segment::Experiment, Segment::Dataset}};
    static const FolderLayout group_layout {
        FolderStructure::GroupInstrumentFullNameDataset, IdentityKind::GroupName,
        {Segment::Identity, Segment::Instrument, Segment::FullName, Segment::Dataset}};

    switch (structure) {
        case FolderStructure::UsernameDataset: return username_dataset;
        case FolderStructure::EmailDataset: return email_dataset;
        case FolderStructure::UsernameExperimentDataset: return username_experiment_dataset;
        case FolderStructure::EmailExperimentDataset: return email_experiment_dataset;
        case FolderStructure::UsernameMarkerExperimentDataset: return marker_layout;
        case FolderStructure::GroupInstrumentFullNameDataset: return group_layout;
    }
    return username_dataset;
}

} // namespace labsync::model
