#pragma once

#include "labsync/core/result.hpp"
#include "labsync/model/owner.hpp"

#include <string>
#include <vector>

namespace labsync::model {

/// Supported layouts of the local data directory.
enum class FolderStructure {
    UsernameDataset,
    EmailDataset,
    UsernameExperimentDataset,
    EmailExperimentDataset,
    UsernameMarkerExperimentDataset,
    GroupInstrumentFullNameDataset
};

/// Role of the directory found at one depth below the data directory.
enum class Segment {
    Identity,
    Marker,
    Experiment,
    Instrument,
    FullName,
    Dataset
};

/// Fixed-depth pattern a folder structure describes.
struct FolderLayout {
    FolderStructure structure;
    IdentityKind identity;
    std::vector<Segment> segments;  ///< segments.front() is Identity, back() is Dataset

    [[nodiscard]] std::size_t depth() const noexcept { return segments.size(); }
    [[nodiscard]] bool has_segment(Segment segment) const;
};

/// Reserved directory name of the marker layout, matched case-insensitively.
inline constexpr const char* kMarkerFolderName = "MyTardis";

Result<FolderStructure> parse_folder_structure(const std::string& text);
const char* folder_structure_name(FolderStructure structure);
const FolderLayout& layout_of(FolderStructure structure);

} // namespace labsync::model
