#pragma once

#include "Teul/Public/DocumentModel.h"
#include <optional>

namespace Teul::Serialization
{
    juce::Result serializeDocumentToJsonString(const DocumentModel& document, juce::String& jsonOut);
    juce::Result parseDocumentFromJsonString(const juce::String& json, std::optional<DocumentModel>& documentOut);

    // Clipboard form of a single subtree. Ids are kept; callers re-stamp before inserting.
    juce::String serializeSubtreeToJsonString(const Core::Tree& subtree);
    juce::Result parseSubtreeFromJsonString(const juce::String& json, std::optional<Core::Tree>& subtreeOut);

    juce::Result saveDocumentToFile(const juce::File& file, const DocumentModel& document);
    juce::Result loadDocumentFromFile(const juce::File& file, std::optional<DocumentModel>& documentOut);
}
