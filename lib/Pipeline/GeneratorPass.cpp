//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the serializable-class and enum generation passes.
///
//===----------------------------------------------------------------------===//

#include "llvmjsongen/Pipeline/GeneratorPass.h"

#include "llvmjsongen/CodeGen/CodeEmitter.h"
#include "llvmjsongen/CodeGen/ConversionRegistry.h"
#include "llvmjsongen/CodeGen/MemberInsertion.h"
#include "llvmjsongen/Semantics/FieldSelector.h"

#include <iterator>
#include <map>
#include <optional>
#include <utility>

namespace llvmjsongen
{
namespace
{

/// @brief Per-class state resolved before any fragment is emitted.
struct PreparedClass final
{
    const ClassModel*            model{nullptr};
    std::vector<FieldDescriptor> fields;
    ResolvedConfig               config;
};

SourceLocation classLocation(const UnitModel& unit, const ClassModel& model)
{
    return SourceLocation{unit.sourcePath, model.line, 1};
}

void reportMemberPresence(DiagnosticEngine&     diagnostics,
                          const SourceLocation& location,
                          const std::string&    className,
                          llvm::StringRef       member,
                          const MemberPresence  presence)
{
    if (presence == MemberPresence::Conflicting)
    {
        diagnostics.warning(location,
                            className,
                            "`" + member.str() +
                                "` is already declared with a different signature; the member forwarder is not generated.");
    }
    else if (presence == MemberPresence::Defined)
    {
        diagnostics.note(location,
                         className,
                         "`" + member.str() + "` is defined in the class body; the member forwarder is not generated.");
    }
}

}  // namespace

llvm::Expected<PassOutput> SerializablePass::run(const UnitSnapshot& snapshot, DiagnosticEngine& diagnostics) const
{
    const UnitModel& unit = snapshot.unit;

    // Every class is resolved first: codecs of one class depend on what is generated for the others.
    std::vector<PreparedClass>             prepared;
    std::map<std::string, ClassCodecFacts> facts;
    for (const ClassModel& model : unit.classes)
    {
        if (!model.serializableAnnotation)
        {
            continue;
        }
        auto fields = collectSortedFields(unit, model);
        if (!fields)
        {
            return fields.takeError();
        }
        auto config = resolveClassConfig(snapshot.global.options, model, *fields);
        if (!config)
        {
            return config.takeError();
        }
        facts[model.name] = ClassCodecFacts{model.typeParameters.size(),
                                            config->genericArgumentFactories,
                                            config->createFactory,
                                            config->createToJson};
        prepared.push_back(PreparedClass{&model, std::move(*fields), std::move(*config)});
    }

    PassOutput  output;
    std::string prototypes;
    for (const PreparedClass& entry : prepared)
    {
        prototypes += emitPrototypes(*entry.model, entry.config);
    }
    output.fragments.push_back(std::move(prototypes));

    for (const PreparedClass& entry : prepared)
    {
        const ClassModel&    model    = *entry.model;
        const SourceLocation location = classLocation(unit, model);

        auto selection = selectFields(model, entry.fields, entry.config, unit.sourcePath, diagnostics);
        if (!selection)
        {
            return selection.takeError();
        }
        for (const FieldExclusion& exclusion : selection->excluded)
        {
            diagnostics.note(location,
                             model.name + "." + exclusion.fieldName,
                             "excluded from " + fieldDirectionName(exclusion.direction).str() + ": " + exclusion.reason);
        }

        const ConversionRegistry registry(makeConversionContext(unit,
                                                                facts,
                                                                snapshot.global.typeCodecs,
                                                                &model,
                                                                entry.config.genericArgumentFactories));
        if (entry.config.addMembers && !model.typeParameters.empty())
        {
            diagnostics.warning(location, model.name, "addMembers is ignored for classes with type parameters.");
        }

        // The in-place plan decides which member forwarders the companion may define.
        ForwarderSuppression            suppression;
        std::optional<PatchInstruction> patch;
        if (snapshot.allowPatches && wantsMemberInsertion(model, entry.config))
        {
            if (!snapshot.sourceText)
            {
                diagnostics.error(location,
                                  model.name,
                                  "IoError: cannot read " + unit.sourcePath + ": " + snapshot.sourceError);
                suppression = ForwarderSuppression{true, true};
            }
            else if (auto plan = planMemberInsertion(model,
                                                     entry.config,
                                                     unit.sourcePath,
                                                     *snapshot.sourceText,
                                                     unit.cppNamespace))
            {
                suppression = plan->suppressedForwarders();
                reportMemberPresence(diagnostics, location, model.name, "fromJson", plan->fromJson);
                reportMemberPresence(diagnostics, location, model.name, "toJson", plan->toJson);
                patch = std::move(plan->patch);
            }
            else
            {
                // In-place failures leave the rest of the companion output of the class intact.
                reportGenerationError(diagnostics, location, plan.takeError());
                suppression = ForwarderSuppression{true, true};
            }
        }

        auto fragments =
            emitClassFragments(ClassEmitInput{model, entry.config, *selection, registry, suppression}, unit);
        if (!fragments)
        {
            return fragments.takeError();
        }
        output.fragments.insert(output.fragments.end(),
                                std::make_move_iterator(fragments->begin()),
                                std::make_move_iterator(fragments->end()));
        if (patch)
        {
            output.patches.push_back(std::move(*patch));
        }
    }
    return output;
}

llvm::Expected<PassOutput> EnumPass::run(const UnitSnapshot& snapshot, DiagnosticEngine& /*diagnostics*/) const
{
    PassOutput output;
    for (const EnumModel& model : snapshot.unit.enums)
    {
        if (!model.enumAnnotation)
        {
            continue;
        }
        auto table = emitEnumMap(model);
        if (!table)
        {
            return table.takeError();
        }
        output.fragments.push_back(std::move(*table));
    }
    return output;
}

std::vector<GeneratorPass> defaultPasses()
{
    return {SerializablePass{}, EnumPass{}};
}

llvm::Expected<PassOutput> runPass(const GeneratorPass& pass, const UnitSnapshot& snapshot, DiagnosticEngine& diagnostics)
{
    return std::visit([&](const auto& concrete) { return concrete.run(snapshot, diagnostics); }, pass);
}

llvm::StringRef passName(const GeneratorPass& pass)
{
    return std::visit([](const auto& concrete) { return concrete.name(); }, pass);
}

}  // namespace llvmjsongen
