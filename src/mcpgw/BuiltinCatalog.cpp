//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: BuiltinCatalog.cpp
// Purpose: Default genome-browser tool set
//==========================================================================================================

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include "logging/Logger.h"
#include "mcpgw/BuiltinCatalog.h"

namespace mcpgw {

namespace {

ParameterSpec param(std::string name, ParamType type, std::string description, bool required = false) {
    ParameterSpec p;
    p.name = std::move(name);
    p.type = type;
    p.description = std::move(description);
    p.required = required;
    return p;
}

ParameterSpec clientIdParam() {
    return param("clientId", ParamType::String, "Browser client ID");
}

ToolDescriptor clientTool(std::string name, std::string category, std::string description,
                          std::vector<ParameterSpec> params) {
    ToolDescriptor d;
    d.name = std::move(name);
    d.category = std::move(category);
    d.description = std::move(description);
    d.parameters = std::move(params);
    d.parameters.push_back(clientIdParam());
    d.site = ExecutionSite::ClientSide;
    return d;
}

std::string requireSequence(const JSONValue& arguments) {
    auto seq = GetStringMember(arguments, "sequence");
    if (!seq.has_value()) {
        throw std::invalid_argument("sequence must be a string");
    }
    std::string s = *seq;
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    for (char c : s) {
        if (c != 'A' && c != 'C' && c != 'G' && c != 'T' && c != 'N') {
            throw std::invalid_argument(std::string("Invalid nucleotide '") + c + "'");
        }
    }
    return s;
}

JSONValue reverseComplement(const JSONValue& arguments) {
    const std::string seq = requireSequence(arguments);
    std::string out(seq.rbegin(), seq.rend());
    for (char& c : out) {
        switch (c) {
            case 'A': c = 'T'; break;
            case 'T': c = 'A'; break;
            case 'C': c = 'G'; break;
            case 'G': c = 'C'; break;
            default: break;
        }
    }
    JSONValue::Object obj;
    obj["sequence"] = std::make_shared<JSONValue>(out);
    obj["length"] = std::make_shared<JSONValue>(static_cast<int64_t>(out.size()));
    return JSONValue{obj};
}

JSONValue gcContent(const JSONValue& arguments) {
    const std::string seq = requireSequence(arguments);
    const auto gc = std::count_if(seq.begin(), seq.end(), [](char c) { return c == 'G' || c == 'C'; });
    const double pct = seq.empty() ? 0.0 : 100.0 * static_cast<double>(gc) / static_cast<double>(seq.size());
    JSONValue::Object obj;
    obj["length"] = std::make_shared<JSONValue>(static_cast<int64_t>(seq.size()));
    obj["gcCount"] = std::make_shared<JSONValue>(static_cast<int64_t>(gc));
    obj["gcPercent"] = std::make_shared<JSONValue>(pct);
    return JSONValue{obj};
}

std::vector<ToolDescriptor> navigationTools() {
    return {
        clientTool("navigate_to_position", "navigation",
                   "Navigate to a genomic position. With only position, shows a 2000bp window centred on it.",
                   {param("chromosome", ParamType::String, "Chromosome name", true),
                    param("start", ParamType::Number, "Start position"),
                    param("end", ParamType::Number, "End position"),
                    param("position", ParamType::Number, "Centre position")}),
        clientTool("open_new_tab", "navigation", "Open a new browser tab for a position, gene or the current view",
                   {param("chromosome", ParamType::String, "Chromosome name"),
                    param("start", ParamType::Number, "Start position"),
                    param("end", ParamType::Number, "End position"),
                    param("geneName", ParamType::String, "Gene to focus in the new tab"),
                    param("title", ParamType::String, "Tab title")}),
        clientTool("jump_to_gene", "navigation", "Jump to a gene location by name or locus tag",
                   {param("geneName", ParamType::String, "Gene name or locus tag", true)}),
        clientTool("get_current_state", "navigation", "Current view state of the genome browser", {}),
    };
}

std::vector<ToolDescriptor> searchTools() {
    return {
        clientTool("search_features", "search", "Search genomic features",
                   {param("query", ParamType::String, "Search query", true),
                    param("featureType", ParamType::String, "Feature type to search for")}),
        clientTool("search_gene_by_name", "search", "Search a gene by name or locus tag",
                   {param("name", ParamType::String, "Gene name or locus tag", true)}),
        clientTool("get_genome_info", "search", "Summary of the loaded genome", {}),
    };
}

std::vector<ToolDescriptor> sequenceTools() {
    ParameterSpec strand = param("strand", ParamType::String, "Strand (+ forward, - reverse)");
    strand.defaultValue = JSONValue("+");
    return {
        clientTool("get_sequence", "sequence", "Sequence of a region",
                   {param("chromosome", ParamType::String, "Chromosome name", true),
                    param("start", ParamType::Integer, "Start position (1-based)", true),
                    param("end", ParamType::Integer, "End position (1-based)", true),
                    strand}),
        clientTool("copy_sequence", "sequence", "Copy a region to the clipboard",
                   {param("chromosome", ParamType::String, "Chromosome name", true),
                    param("start", ParamType::Integer, "Start position (1-based)", true),
                    param("end", ParamType::Integer, "End position (1-based)", true),
                    strand}),
        clientTool("insert_sequence", "sequence", "Insert a DNA sequence at a position",
                   {param("chromosome", ParamType::String, "Chromosome name", true),
                    param("position", ParamType::Integer, "Insert position (1-based)", true),
                    param("sequence", ParamType::String, "DNA to insert (A, C, G, T, N)", true)}),
        clientTool("delete_sequence", "sequence", "Delete a region",
                   {param("chromosome", ParamType::String, "Chromosome name", true),
                    param("start", ParamType::Integer, "Start position (1-based)", true),
                    param("end", ParamType::Integer, "End position (1-based)", true)}),
    };
}

std::vector<ToolDescriptor> trackTools() {
    return {
        clientTool("toggle_track", "track", "Show or hide a track",
                   {param("trackName", ParamType::String, "Track name (genes, gc, variants, reads, proteins)", true),
                    param("visible", ParamType::Boolean, "Whether the track is shown", true)}),
        clientTool("list_tracks", "track", "Tracks and their visibility", {}),
    };
}

std::vector<ToolDescriptor> annotationTools() {
    return {
        clientTool("create_annotation", "annotation", "Create a user-defined annotation",
                   {param("type", ParamType::String, "Feature type (gene, CDS, rRNA, tRNA, ...)", true),
                    param("name", ParamType::String, "Feature name", true),
                    param("chromosome", ParamType::String, "Chromosome name", true),
                    param("start", ParamType::Integer, "Start position", true),
                    param("end", ParamType::Integer, "End position", true),
                    param("strand", ParamType::Integer, "1 forward, -1 reverse"),
                    param("description", ParamType::String, "Feature description")}),
        clientTool("get_annotations", "annotation", "Annotations overlapping a region",
                   {param("chromosome", ParamType::String, "Chromosome name", true),
                    param("start", ParamType::Integer, "Start position"),
                    param("end", ParamType::Integer, "End position")}),
    };
}

std::vector<ToolDescriptor> analysisTools() {
    ParameterSpec organism = param("organism", ParamType::String, "Reference organism");
    organism.defaultValue = JSONValue("E. coli");
    ParameterSpec stats = param("includeStatistics", ParamType::Boolean, "Include detailed statistics");
    stats.defaultValue = JSONValue(true);

    std::vector<ToolDescriptor> tools = {
        clientTool("analyze_region", "analysis", "Features and GC content of a region",
                   {param("chromosome", ParamType::String, "Chromosome name", true),
                    param("start", ParamType::Integer, "Start position", true),
                    param("end", ParamType::Integer, "End position", true),
                    param("includeFeatures", ParamType::Boolean, "Include feature annotations"),
                    param("includeGC", ParamType::Boolean, "Include GC content")}),
        clientTool("codon_usage_analysis", "analysis", "Codon usage of a coding sequence",
                   {param("sequence", ParamType::String, "DNA coding sequence", true),
                    param("geneName", ParamType::String, "Gene name for context"),
                    organism, stats}),
    };

    ToolDescriptor rc;
    rc.name = "reverse_complement";
    rc.category = "analysis";
    rc.description = "Reverse complement of a DNA sequence";
    rc.parameters = {param("sequence", ParamType::String, "DNA sequence (A, C, G, T, N)", true)};
    rc.site = ExecutionSite::ServerSide;
    rc.handler = reverseComplement;
    tools.push_back(std::move(rc));

    ToolDescriptor gc;
    gc.name = "compute_gc_content";
    gc.category = "analysis";
    gc.description = "GC count and percentage of a DNA sequence";
    gc.parameters = {param("sequence", ParamType::String, "DNA sequence (A, C, G, T, N)", true)};
    gc.site = ExecutionSite::ServerSide;
    gc.handler = gcContent;
    tools.push_back(std::move(gc));
    return tools;
}

std::vector<ToolDescriptor> exportTools() {
    return {
        clientTool("export_data", "export", "Export sequence or annotation data",
                   {param("format", ParamType::String, "fasta, genbank, gff or bed", true),
                    param("chromosome", ParamType::String, "Chromosome (omit for full export)"),
                    param("start", ParamType::Integer, "Start position"),
                    param("end", ParamType::Integer, "End position")}),
    };
}

} // namespace

void RegisterBuiltinTools(ToolCatalog& catalog) {
    FUNC_SCOPE();
    for (auto group : {navigationTools(), searchTools(), sequenceTools(), trackTools(),
                       annotationTools(), analysisTools(), exportTools()}) {
        for (auto& tool : group) {
            catalog.Register(std::move(tool));
        }
    }
    LOG_DEBUG("Registered {} builtin tools", catalog.Size());
}

ToolCatalog MakeBuiltinCatalog() {
    ToolCatalog catalog;
    RegisterBuiltinTools(catalog);
    return catalog;
}

} // namespace mcpgw
